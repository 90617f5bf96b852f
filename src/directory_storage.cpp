/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/directory_storage.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace meshxfer {

namespace {

	constexpr std::size_t max_filename_length = 255;

	bool is_safe_char(char const c)
	{
		return (c >= 'a' && c <= 'z')
			|| (c >= 'A' && c <= 'Z')
			|| (c >= '0' && c <= '9')
			|| c == '.' || c == '-' || c == '_' || c == ' ';
	}

	// splits "name.ext" into "name" and ".ext". A leading dot does not start
	// an extension
	std::pair<std::string, std::string> split_extension(std::string const& name)
	{
		auto const dot = name.rfind('.');
		if (dot == std::string::npos || dot == 0) return {name, std::string()};
		return {name.substr(0, dot), name.substr(dot)};
	}

	std::string combine_path(std::string const& lhs, std::string const& rhs)
	{
		if (lhs.empty() || lhs == ".") return rhs;
		if (lhs.back() == '/') return lhs + rhs;
		return lhs + "/" + rhs;
	}

	error_code create_directory(std::string const& path)
	{
		if (path.empty()) return {};
		if (::mkdir(path.c_str(), 0777) == 0 || errno == EEXIST) return {};
		return error_code(errno, generic_category());
	}

	// writes the whole buffer to a newly created file. Returns EEXIST in ``ec``
	// if the file already exists
	error_code write_new_file(std::string const& path, std::vector<char> const& data)
	{
		int const fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
		if (fd < 0) return error_code(errno, generic_category());

		error_code ec;
		std::size_t written = 0;
		while (written < data.size())
		{
			ssize_t const ret = ::write(fd, data.data() + written, data.size() - written);
			if (ret < 0)
			{
				if (errno == EINTR) continue;
				ec.assign(errno, generic_category());
				break;
			}
			written += std::size_t(ret);
		}

		if (::close(fd) != 0 && !ec)
			ec.assign(errno, generic_category());

		// don't leave a truncated file behind
		if (ec) ::unlink(path.c_str());
		return ec;
	}
}

	std::string sanitize_filename(std::string const& name)
	{
		// only keep the last path element, whichever separator is used
		auto const sep = name.find_last_of("/\\");
		std::string base = sep == std::string::npos ? name : name.substr(sep + 1);

		std::string ret;
		ret.reserve(base.size());
		for (char const c : base)
			ret.push_back(is_safe_char(c) ? c : '_');

		// no hidden files, and nothing that's just dots
		auto const first = ret.find_first_not_of(". ");
		if (first == std::string::npos) return "unnamed_file";
		ret.erase(0, first);
		while (!ret.empty() && ret.back() == ' ') ret.pop_back();

		if (ret.size() > max_filename_length)
		{
			auto parts = split_extension(ret);
			if (parts.second.size() >= max_filename_length)
				parts.second.clear();
			parts.first.resize(max_filename_length - parts.second.size());
			ret = parts.first + parts.second;
		}
		return ret;
	}

	directory_storage::directory_storage(std::string save_path)
		: m_save_path(std::move(save_path))
	{}

	error_code directory_storage::save(std::string const& filename
		, std::vector<char> const& data)
	{
		error_code ec = create_directory(m_save_path);
		if (ec) return ec;

		std::string const safe_name = sanitize_filename(filename);
		auto const parts = split_extension(safe_name);

		std::string path = combine_path(m_save_path, safe_name);
		for (int counter = 1;; ++counter)
		{
			ec = write_new_file(path, data);
			if (ec != boost::system::errc::file_exists) break;
			path = combine_path(m_save_path, parts.first + "_"
				+ std::to_string(counter) + parts.second);
		}
		if (ec) return ec;

		std::lock_guard<std::mutex> l(m_mutex);
		m_last_saved = path;
		return {};
	}

	std::string directory_storage::last_saved_path() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_last_saved;
	}
}
