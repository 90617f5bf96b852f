/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_DIRECTORY_STORAGE_HPP_INCLUDED
#define MESHXFER_DIRECTORY_STORAGE_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/transport.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace meshxfer {

	// turns a filename received from a remote node into one that is safe to
	// create in a local directory. Directory components are dropped, leading
	// dots are removed and characters other than letters, digits, ``.``,
	// ``-``, ``_`` and space are replaced by ``_``. A name that ends up empty
	// becomes ``unnamed_file``. Names longer than 255 bytes are shortened,
	// preserving the extension.
	MESHXFER_EXPORT std::string sanitize_filename(std::string const& name);

	// a storage_interface saving completed files into a directory. Existing
	// files are never overwritten, instead a ``_1``, ``_2``, ... suffix is
	// added to the base name.
	class MESHXFER_EXPORT directory_storage final : public storage_interface
	{
	public:
		explicit directory_storage(std::string save_path);

		error_code save(std::string const& filename
			, std::vector<char> const& data) override;

		// the path of the most recently saved file
		std::string last_saved_path() const;

		std::string const& save_path() const { return m_save_path; }

	private:
		std::string const m_save_path;

		mutable std::mutex m_mutex;
		std::string m_last_saved;
	};
}

#endif // MESHXFER_DIRECTORY_STORAGE_HPP_INCLUDED
