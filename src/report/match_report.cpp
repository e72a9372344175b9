/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

match_report.cpp implementation.*/

#include "match_report.hpp"

#include <cerrno>
#include <exception>
#include <fstream>
#include <system_error>

namespace roundstat::report {

bool EnsureDirectory(const std::filesystem::path& directory, std::string& error) {
	if (directory.empty())
		return true;

	std::error_code dirError;
	std::filesystem::create_directories(directory, dirError);
	if (dirError) {
		error = "failed to create directory '" + directory.string() + "': " + dirError.message();
		return false;
	}

	return true;
}

bool WriteTextFile(const std::filesystem::path& path, std::string_view contents, std::string& error) {
	try {
		std::ofstream file(path, std::ios::binary | std::ios::trunc);
		if (!file.is_open()) {
			const std::error_code ec(errno, std::system_category());
			error = "failed to open '" + path.string() + "' (" + ec.message() + ")";
			return false;
		}

		file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
		file.close();
		if (!file) {
			error = "failed to write '" + path.string() + "'";
			return false;
		}

		return true;
	}
	catch (const std::exception& e) {
		error = "exception while writing '" + path.string() + "': " + e.what();
	}

	return false;
}

} // namespace roundstat::report
