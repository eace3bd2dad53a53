#include <sys/statvfs.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <mutex>
#include <string>
#include <unordered_map>

#pragma once

class Logger
{
	public:
		enum class LogFieldType {
    		STRING,
    		INT64,
    		UINT64,
    		BOOL
		};

		struct LogField {
    		const char* key;

    		LogFieldType type;
    		union {
        		const char* str;
        		int64_t i64;
        		uint64_t u64;
        		bool b;
    		};

    		LogField(const char* k, const char* v)
        		: key(k), type(LogFieldType::STRING), str(v) {}

			// the string must outlive the log_event() call
    		LogField(const char* k, const std::string& v)
        		: key(k), type(LogFieldType::STRING), str(v.c_str()) {}

    		LogField(const char* k, int v)
        		: key(k), type(LogFieldType::INT64), i64(v) {}

    		LogField(const char* k, int64_t v)
        		: key(k), type(LogFieldType::INT64), i64(v) {}

    		LogField(const char* k, uint64_t v)
        		: key(k), type(LogFieldType::UINT64), u64(v) {}

    		LogField(const char* k, bool v)
        		: key(k), type(LogFieldType::BOOL), b(v) {}
		};

		enum class LogLevel {
			INFO,
			WARN,
			ERROR,
		};

		enum class LogEvent {
			SERVICE_START,					// INFO
			SERVICE_STOP,					// INFO
			CLIENT_CONNECT,					// INFO
			CLIENT_AUTH_SUCCESS,			// INFO
			CLIENT_AUTH_FAILURE,			// WARN
			REQUEST_REJECTED,				// WARN
			UPLOAD_WAITING,					// INFO
			UPLOAD_START,					// INFO
			UPLOAD_COMPLETE,				// INFO
			UPLOAD_FAILURE,					// ERROR
			UPLOAD_ABORT,					// WARN
			UPLOAD_CONFLICT,				// WARN
			DOWNLOAD_WAITING,				// INFO
			DOWNLOAD_START,					// INFO
			DOWNLOAD_COMPLETE,				// INFO
			DOWNLOAD_FAILURE,				// ERROR
			DOWNLOAD_ABORT,					// WARN
			DOWNLOAD_NOT_FOUND,				// WARN
			PAIR_TIMEOUT,					// WARN
			TOKEN_ISSUED,					// INFO
			TOKEN_REJECTED,					// WARN
			TOKEN_SWEEP,					// INFO
			INTERNAL_ERROR					// ERROR
		};

		struct LoggerConfig {
			// empty path logs to stderr
			std::filesystem::path log_path;

			// rotate once the current file reaches this size, 0 disables rotation
			size_t max_bytes = 10 * 1024 * 1024;

			LogLevel min_level = LogLevel::INFO;
		};

		explicit Logger(const LoggerConfig& config);
		~Logger();

		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

		void log_event(LogEvent event, std::initializer_list<LogField> fields = {});

		LogLevel level_of(LogEvent event) const;

		static const char* event_to_string(LogEvent event);
		static const char* level_to_string(LogLevel level);

		// renders one line without the trailing newline
		std::string format(LogEvent event, std::initializer_list<LogField> fields, int64_t timestamp) const;

	private:
		LoggerConfig config;

		std::unordered_map<LogEvent, LogLevel> level_map;

		int logfd_ = 2;
		bool owns_fd_ = false;
		bool logs_enabled = true;
		size_t log_cur_bytes_ = 0;

		std::mutex mutex;

		unsigned long long get_avail_storage() const;
		void log_rotate();
};
