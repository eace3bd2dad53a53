#include "download_file.hpp"

#include <stdexcept>
#include <system_error>

DownloadFile::DownloadFile(const std::filesystem::path& final_path)
	: final_path(final_path), tmp(final_path.string() + ".tmp")
{
	out_file.open(tmp, std::ios::binary | std::ios::trunc);
	if (!out_file.is_open()) {
		throw std::runtime_error("Failed to create " + tmp.string());
	}
}

DownloadFile::~DownloadFile()
{
	abort();
}

void DownloadFile::write(const uint8_t* data, size_t len)
{
	if (!active) throw std::logic_error("Download not active");

	out_file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
	if (!out_file) {
		throw std::runtime_error("Failed to write " + tmp.string());
	}
	written += len;
}

void DownloadFile::flush()
{
	out_file.flush();
}

void DownloadFile::commit()
{
	if (!active) throw std::logic_error("Download not active");

	out_file.close();
	if (out_file.fail()) {
		throw std::runtime_error("Failed to close " + tmp.string());
	}

	std::filesystem::rename(tmp, final_path);
	active = false;
}

void DownloadFile::abort()
{
	if (!active) return;

	out_file.close();

	std::error_code ec;
	std::filesystem::remove(tmp, ec);

	active = false;
}
