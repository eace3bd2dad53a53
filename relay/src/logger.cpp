#include "logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cstdio>
#include <ctime>
#include <iostream>

Logger::Logger(const LoggerConfig& cfg)
	: config(cfg)
{
	level_map[LogEvent::SERVICE_START] = LogLevel::INFO;
	level_map[LogEvent::SERVICE_STOP] = LogLevel::INFO;
	level_map[LogEvent::CLIENT_CONNECT] = LogLevel::INFO;
	level_map[LogEvent::CLIENT_AUTH_SUCCESS] = LogLevel::INFO;
	level_map[LogEvent::CLIENT_AUTH_FAILURE] = LogLevel::WARN;
	level_map[LogEvent::REQUEST_REJECTED] = LogLevel::WARN;
	level_map[LogEvent::UPLOAD_WAITING] = LogLevel::INFO;
	level_map[LogEvent::UPLOAD_START] = LogLevel::INFO;
	level_map[LogEvent::UPLOAD_COMPLETE] = LogLevel::INFO;
	level_map[LogEvent::UPLOAD_FAILURE] = LogLevel::ERROR;
	level_map[LogEvent::UPLOAD_ABORT] = LogLevel::WARN;
	level_map[LogEvent::UPLOAD_CONFLICT] = LogLevel::WARN;
	level_map[LogEvent::DOWNLOAD_WAITING] = LogLevel::INFO;
	level_map[LogEvent::DOWNLOAD_START] = LogLevel::INFO;
	level_map[LogEvent::DOWNLOAD_COMPLETE] = LogLevel::INFO;
	level_map[LogEvent::DOWNLOAD_FAILURE] = LogLevel::ERROR;
	level_map[LogEvent::DOWNLOAD_ABORT] = LogLevel::WARN;
	level_map[LogEvent::DOWNLOAD_NOT_FOUND] = LogLevel::WARN;
	level_map[LogEvent::PAIR_TIMEOUT] = LogLevel::WARN;
	level_map[LogEvent::TOKEN_ISSUED] = LogLevel::INFO;
	level_map[LogEvent::TOKEN_REJECTED] = LogLevel::WARN;
	level_map[LogEvent::TOKEN_SWEEP] = LogLevel::INFO;
	level_map[LogEvent::INTERNAL_ERROR] = LogLevel::ERROR;

	if (config.log_path.empty()) return;

	logfd_ = ::open(
		config.log_path.c_str(),
		O_WRONLY | O_CREAT | O_APPEND,
		0644
	);
	if (logfd_ == -1) {
		std::cerr << "Failed to open log file " << config.log_path << ", logging to stderr" << std::endl;
		logfd_ = 2;
		return;
	}

	owns_fd_ = true;

	// statvfs is used to check available disk space
	// if we can't check disk space then file logging is disabled
	if (get_avail_storage() == 0) {
		perror("Failed to query free space for the log directory. Logging will be disabled.");
		logs_enabled = false;
	}

	off_t existing = ::lseek(logfd_, 0, SEEK_END);
	log_cur_bytes_ = existing > 0 ? static_cast<size_t>(existing) : 0;
}

Logger::~Logger()
{
	if (owns_fd_) {
		::close(logfd_);
	}
}

unsigned long long Logger::get_avail_storage() const
{
	if (!owns_fd_) return ~0ULL;

	struct statvfs stat;
	if (fstatvfs(logfd_, &stat) != 0) return 0;

	unsigned long long available = stat.f_bavail * stat.f_frsize;
	return available;
}

void Logger::log_rotate()
{
	if (!owns_fd_ || config.max_bytes == 0) return;
	if (log_cur_bytes_ < config.max_bytes) return;

	::close(logfd_);

	std::string rotated = config.log_path.string() + ".1";
	::rename(config.log_path.c_str(), rotated.c_str());

	logfd_ = ::open(
		config.log_path.c_str(),
		O_WRONLY | O_CREAT | O_TRUNC,
		0644
	);
	if (logfd_ == -1) {
		owns_fd_ = false;
		logfd_ = 2;
	}

	log_cur_bytes_ = 0;
}

Logger::LogLevel Logger::level_of(LogEvent event) const
{
	auto it = level_map.find(event);
	if (it == level_map.end()) return LogLevel::INFO;
	return it->second;
}

const char* Logger::level_to_string(LogLevel level)
{
	switch (level) {
		case LogLevel::INFO: return "INFO";
		case LogLevel::WARN: return "WARN";
		case LogLevel::ERROR: return "ERROR";
	}
	return "INFO";
}

const char* Logger::event_to_string(LogEvent event)
{
	switch (event) {
		case LogEvent::SERVICE_START: return "SERVICE_START";
		case LogEvent::SERVICE_STOP: return "SERVICE_STOP";
		case LogEvent::CLIENT_CONNECT: return "CLIENT_CONNECT";
		case LogEvent::CLIENT_AUTH_SUCCESS: return "CLIENT_AUTH_SUCCESS";
		case LogEvent::CLIENT_AUTH_FAILURE: return "CLIENT_AUTH_FAILURE";
		case LogEvent::REQUEST_REJECTED: return "REQUEST_REJECTED";
		case LogEvent::UPLOAD_WAITING: return "UPLOAD_WAITING";
		case LogEvent::UPLOAD_START: return "UPLOAD_START";
		case LogEvent::UPLOAD_COMPLETE: return "UPLOAD_COMPLETE";
		case LogEvent::UPLOAD_FAILURE: return "UPLOAD_FAILURE";
		case LogEvent::UPLOAD_ABORT: return "UPLOAD_ABORT";
		case LogEvent::UPLOAD_CONFLICT: return "UPLOAD_CONFLICT";
		case LogEvent::DOWNLOAD_WAITING: return "DOWNLOAD_WAITING";
		case LogEvent::DOWNLOAD_START: return "DOWNLOAD_START";
		case LogEvent::DOWNLOAD_COMPLETE: return "DOWNLOAD_COMPLETE";
		case LogEvent::DOWNLOAD_FAILURE: return "DOWNLOAD_FAILURE";
		case LogEvent::DOWNLOAD_ABORT: return "DOWNLOAD_ABORT";
		case LogEvent::DOWNLOAD_NOT_FOUND: return "DOWNLOAD_NOT_FOUND";
		case LogEvent::PAIR_TIMEOUT: return "PAIR_TIMEOUT";
		case LogEvent::TOKEN_ISSUED: return "TOKEN_ISSUED";
		case LogEvent::TOKEN_REJECTED: return "TOKEN_REJECTED";
		case LogEvent::TOKEN_SWEEP: return "TOKEN_SWEEP";
		case LogEvent::INTERNAL_ERROR: return "INTERNAL_ERROR";
	}
	return "UNKNOWN";
}

std::string Logger::format(LogEvent event, std::initializer_list<LogField> fields, int64_t timestamp) const
{
	std::string line = "[" + std::to_string(timestamp) + "] "
		+ level_to_string(level_of(event)) + " "
		+ event_to_string(event);

	for (const LogField& field : fields) {
		line.append(" ");
		line.append(field.key);
		line.append("=");

		switch (field.type) {
			case LogFieldType::STRING: {
				std::string value = field.str ? field.str : "";
				if (value.empty() || value.find_first_of(" \t\"=") != std::string::npos) {
					line.append("\"");
					for (char c : value) {
						if (c == '"' || c == '\\') line.push_back('\\');
						line.push_back(c);
					}
					line.append("\"");
				}
				else {
					line.append(value);
				}
				break;
			}
			case LogFieldType::INT64: {
				line.append(std::to_string(field.i64));
				break;
			}
			case LogFieldType::UINT64: {
				line.append(std::to_string(field.u64));
				break;
			}
			case LogFieldType::BOOL: {
				line.append(field.b ? "true" : "false");
				break;
			}
		}
	}

	return line;
}

void Logger::log_event(LogEvent event, std::initializer_list<LogField> fields)
{
	if (static_cast<int>(level_of(event)) < static_cast<int>(config.min_level)) return;

	std::string line = format(event, fields, static_cast<int64_t>(time(nullptr)));
	line.push_back('\n');

	std::lock_guard<std::mutex> lock(mutex);

	if (logs_enabled == false) return;

	log_rotate();

	if (static_cast<unsigned long long>(line.size()) > get_avail_storage()) return;

	ssize_t written = ::write(logfd_, line.data(), line.size());
	if (written > 0) {
		log_cur_bytes_ += static_cast<size_t>(written);
	}
}
