#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "client.hpp"
#include "download_file.hpp"

namespace {

void usage()
{
	std::cerr << "usage: beam-client [--host H] [--port P] [--user U --pass P] [--token T] <command>\n"
		<< "  upload <file-id> <path>     stream a local file (- for stdin)\n"
		<< "  download <file-id> <path>   receive into path (- for stdout)\n"
		<< "  token                       request a capability token\n"
		<< "  list                        list waiting transfers\n";
}

class StdinSource : public ByteSource
{
	public:
		size_t read(uint8_t* buf, size_t cap) override {
			std::cin.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(cap));
			if (std::cin.bad()) throw StreamReadError("Failed to read stdin");
			return static_cast<size_t>(std::cin.gcount());
		}
};

class StdoutSink : public StreamWriter
{
	public:
		void write(const uint8_t* data, size_t len) override {
			std::cout.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
		}
		void flush() override { std::cout.flush(); }
};

int report(const Client::Response& response)
{
	if (response.status == 200) return 0;

	std::cerr << response.status << " " << response.reason;
	if (!response.body.empty()) std::cerr << ": " << response.body;
	std::cerr << std::endl;
	return 1;
}

}

int main(int argc, char** argv)
{
	Client::Endpoint endpoint;
	Client::Credentials credentials;
	std::vector<std::string> positional;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		bool has_value = i + 1 < argc;

		if (arg == "--host" && has_value) endpoint.host = argv[++i];
		else if (arg == "--port" && has_value) {
			try {
				int port = std::stoi(argv[++i]);
				if (port <= 0 || port > 65535) throw std::out_of_range("port");
				endpoint.port = static_cast<uint16_t>(port);
			}
			catch (const std::logic_error&) {
				std::cerr << "Invalid port: " << argv[i] << std::endl;
				return 1;
			}
		}
		else if (arg == "--user" && has_value) credentials.username = argv[++i];
		else if (arg == "--pass" && has_value) credentials.password = argv[++i];
		else if (arg == "--token" && has_value) credentials.token = argv[++i];
		else if (arg == "-h" || arg == "--help") {
			usage();
			return 0;
		}
		else positional.push_back(arg);
	}

	if (positional.empty()) {
		usage();
		return 1;
	}

	const std::string& cmd = positional[0];

	try {
		Client client(endpoint, credentials);

		if (cmd == "upload" && positional.size() == 3) {
			if (positional[2] == "-") {
				StdinSource source;
				return report(client.upload(positional[1], source));
			}

			FileSource source(positional[2]);
			return report(client.upload(positional[1], source, source.size()));
		}

		if (cmd == "download" && positional.size() == 3) {
			if (positional[2] == "-") {
				StdoutSink sink;
				return report(client.download(positional[1], sink));
			}

			DownloadFile file(positional[2]);
			Client::Response response = client.download(positional[1], file);
			if (response.status == 200) {
				file.commit();
				std::cerr << "Received " << file.bytes_written() << " bytes" << std::endl;
			}
			return report(response);
		}

		if (cmd == "token" && positional.size() == 1) {
			std::cout << client.issue_token() << std::endl;
			return 0;
		}

		if (cmd == "list" && positional.size() == 1) {
			Client::Response response = client.get("/api/streams");
			if (response.status == 200) std::cout << response.body << std::endl;
			return report(response);
		}
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	usage();
	return 1;
}
