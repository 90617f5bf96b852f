/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_ALERT_HPP_INCLUDED
#define MESHXFER_ALERT_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/time.hpp"

#include <cstdint>
#include <string>

// OVERVIEW
//
// The sender and receiver report what they are doing through alerts. An
// alert is a typed message object, posted to an alert_manager and later
// retrieved by the client with alert_manager::get_all() or
// alert_manager::wait_for_alert().
//
// Every alert belongs to one category. Only alerts whose category is set in
// the manager's alert mask are posted, so the mask decides how verbose the
// engine is. Log messages (the ``transfer_log`` category) are disabled by
// default.
//
// To find out the concrete type of an alert, compare ``type()`` with the
// static ``alert_type`` member of the alert type, or use alert_cast<>().

namespace meshxfer {

	using alert_category_t = std::uint32_t;

namespace alert_category {

	// Enables alerts that report an error. This includes transfers failing,
	// files that cannot be saved and messages that cannot be sent.
	constexpr alert_category_t error = 1 << 0;

	// Enables alerts for state changes of a transfer, such as a file being
	// announced, saved or fully acknowledged.
	constexpr alert_category_t status = 1 << 1;

	// Enables debug log messages for individual transfers
	constexpr alert_category_t transfer_log = 1 << 2;

	// Alerts when the sender slows down because the link loses pieces
	constexpr alert_category_t performance_warning = 1 << 3;

	// Enables alerts about piece level progress, such as resume requests
	constexpr alert_category_t piece_progress = 1 << 4;

	constexpr alert_category_t all = 0xffffffff;
}

	// The ``alert`` class is the base class that specific messages are
	// derived from. alert types are not copyable, and cannot be constructed
	// by the client.
	class MESHXFER_EXPORT alert
	{
	public:

		// hidden
		alert(alert const& rhs) = delete;
		alert& operator=(alert const&) = delete;

		// hidden
		alert();
		// hidden
		virtual ~alert();

		// a timestamp is automatically created in the constructor
		time_point timestamp() const;

		// returns an integer that is unique to this alert type. It can be
		// compared against a specific alert by querying a static constant
		// called ``alert_type`` in the alert.
		virtual int type() const noexcept = 0;

		// returns a string literal describing the type of the alert. It does
		// not include any information that might be bundled with the alert.
		virtual char const* what() const noexcept = 0;

		// generate a string describing the alert and the information bundled
		// with it.
		virtual std::string message() const = 0;

		// returns a bitmask specifying which categories this alert belongs
		// to.
		virtual alert_category_t category() const noexcept = 0;

	private:
		time_point const m_timestamp;
	};

	// When you get an alert, you can use ``alert_cast<>`` to attempt to cast
	// the pointer to a specific alert type, in order to query it for more
	// information. It returns nullptr if the alert is not of type T.
	template <class T> T* alert_cast(alert* a)
	{
		if (a == nullptr) return nullptr;
		if (a->type() == T::alert_type) return static_cast<T*>(a);
		return nullptr;
	}
	template <class T> T const* alert_cast(alert const* a)
	{
		if (a == nullptr) return nullptr;
		if (a->type() == T::alert_type) return static_cast<T const*>(a);
		return nullptr;
	}
}

#endif // MESHXFER_ALERT_HPP_INCLUDED
