#include <filesystem>
#include <fstream>
#include <string>

#include "stream_writer.hpp"

#pragma once

// Writes into <path>.tmp and only moves it into place on commit().
class DownloadFile : public StreamWriter
{
	public:
		explicit DownloadFile(const std::filesystem::path& final_path);
		~DownloadFile();

		DownloadFile(const DownloadFile&) = delete;
		DownloadFile& operator=(const DownloadFile&) = delete;

		void write(const uint8_t* data, size_t len) override;
		void flush() override;

		void commit();
		void abort();

		uint64_t bytes_written() const { return written; }
		const std::filesystem::path& tmp_path() const { return tmp; }

	private:
		std::filesystem::path final_path;
		std::filesystem::path tmp;
		std::ofstream out_file;

		uint64_t written = 0;
		bool active = true;
};
