/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/sender.hpp"
#include "meshxfer/receiver.hpp"
#include "meshxfer/alert_manager.hpp"
#include "meshxfer/alert_types.hpp"
#include "meshxfer/directory_storage.hpp"
#include "meshxfer/load_config.hpp"
#include "meshxfer/transport.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace mx = meshxfer;

namespace {

char const sender_node[] = "!a1b2c3d4";
char const receiver_node[] = "!e5f6a7b8";

// a radio link that loses ``loss_percent`` percent of the messages. The
// messages that make it are delivered on the io_context
struct lossy_link final : mx::transport_interface
{
	lossy_link(boost::asio::io_context& ios, std::string self, int loss)
		: m_ios(ios), m_self(std::move(self)), m_loss(loss) {}

	std::function<void(std::string const&, std::string const&
		, std::vector<char> const&)> deliver;

	mx::error_code send(std::string const& destination
		, std::vector<char> const& payload, int) override
	{
		{
			std::lock_guard<std::mutex> l(m_mutex);
			if (int(m_rng() % 100) < m_loss)
			{
				++m_lost;
				return {};
			}
		}
		boost::asio::post(m_ios, [this, destination, payload]
			{ deliver(m_self, destination, payload); });
		return {};
	}

	int lost() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_lost;
	}

private:
	boost::asio::io_context& m_ios;
	std::string const m_self;
	int const m_loss;

	mutable std::mutex m_mutex;
	std::mt19937 m_rng{std::random_device{}()};
	int m_lost = 0;
};

void print_alerts(mx::alert_manager& alerts, char const* prefix)
{
	std::vector<mx::alert*> all;
	alerts.get_all(all);
	for (auto const* a : all)
		std::printf("[%s] %s\n", prefix, a->message().c_str());
}

}

int main(int argc, char* argv[]) try
{
	if (argc < 3 || argc > 5)
	{
		std::cerr << "usage: ./simulate_transfer file output-directory"
			" [loss-percent] [config-file]\n\n"
			"sends file over a simulated radio link that drops loss-percent\n"
			"percent of all messages (default 10) and saves it into\n"
			"output-directory. config-file overrides the default settings.\n";
		return 1;
	}

	int const loss = argc > 3 ? std::atoi(argv[3]) : 10;
	if (loss < 0 || loss >= 100)
	{
		std::cerr << "loss-percent must be in [0, 100)\n";
		return 1;
	}

	mx::settings_pack settings;
	if (argc > 4)
	{
		mx::error_code ec;
		mx::load_config(argv[4], settings, ec);
		if (ec)
		{
			std::fprintf(stderr, "failed to load \"%s\": %s\n"
				, argv[4], ec.message().c_str());
			return 1;
		}
	}

	boost::asio::io_context ios;

	// the sender blocks while it paces pieces, it gets a thread of its own
	boost::asio::io_context sender_ios;
	auto sender_work = boost::asio::make_work_guard(sender_ios);

	int const queue_size = settings.get_int(mx::settings_pack::alert_queue_size);
	mx::alert_manager sender_alerts(queue_size
		, mx::alert_category::error | mx::alert_category::status
		| mx::alert_category::performance_warning);
	mx::alert_manager receiver_alerts(queue_size
		, mx::alert_category::error | mx::alert_category::status
		| mx::alert_category::piece_progress);

	auto sender_link = std::make_shared<lossy_link>(ios, sender_node, loss);
	auto receiver_link = std::make_shared<lossy_link>(ios, receiver_node, loss);
	auto storage = std::make_shared<mx::directory_storage>(argv[2]);

	mx::sender snd(sender_link, sender_alerts, settings);
	mx::receiver rcv(receiver_link, storage, receiver_alerts, settings);

	bool receiver_done = false;

	sender_link->deliver = [&](std::string const& from, std::string const& to
		, std::vector<char> const& payload)
	{
		if (to != receiver_node) return;
		mx::error_code const ec = rcv.incoming_packet(from, payload);
		if (ec) std::fprintf(stderr, "receiver dropped packet: %s\n", ec.message().c_str());
	};

	receiver_link->deliver = [&](std::string const& from, std::string const& to
		, std::vector<char> const& payload)
	{
		if (to != sender_node) return;
		boost::asio::post(sender_ios, [&snd, from, payload]
		{
			mx::error_code const ec = snd.incoming_packet(from, payload);
			if (ec) std::fprintf(stderr, "sender dropped packet: %s\n", ec.message().c_str());
		});
	};

	boost::asio::post(sender_ios, [&]
	{
		mx::error_code ec;
		snd.start_transfer(receiver_node, argv[1], ec);
		if (ec) std::fprintf(stderr, "failed to send \"%s\": %s\n", argv[1]
			, ec.message().c_str());
	});
	std::thread sender_thread([&] { sender_ios.run(); });

	auto const start = std::chrono::steady_clock::now();
	auto last_heard = start;
	auto done_at = start;
	auto const inactivity_timeout = std::chrono::seconds(
		settings.get_int(mx::settings_pack::inactivity_timeout));
	boost::asio::steady_timer timer(ios);
	std::function<void(boost::system::error_code const&)> on_tick
		= [&](boost::system::error_code const& e)
	{
		if (e) return;
		rcv.tick();

		auto const now = std::chrono::steady_clock::now();
		std::vector<mx::alert*> all;
		receiver_alerts.get_all(all);
		if (!all.empty()) last_heard = now;
		for (auto const* a : all)
		{
			std::printf("[receiver] %s\n", a->message().c_str());
			if (mx::alert_cast<mx::file_saved_alert>(a)
				|| mx::alert_cast<mx::transfer_failed_alert>(a))
			{
				receiver_done = true;
				done_at = now;
			}
		}
		print_alerts(sender_alerts, "sender");

		auto const st = snd.status(receiver_node);
		bool const sender_done = !st || st->state != mx::sender_state::sending;

		// the sender may never hear the final acknowledgement if it's lost
		bool const give_up = (receiver_done && now - done_at
			> std::chrono::seconds(rcv.settings().get_int(
				mx::settings_pack::resume_request_interval) * 2 + 5))
			|| now - last_heard > inactivity_timeout;

		if ((receiver_done && sender_done) || give_up)
		{
			ios.stop();
			return;
		}
		timer.expires_after(std::chrono::seconds(1));
		timer.async_wait(on_tick);
	};
	timer.expires_after(std::chrono::seconds(1));
	timer.async_wait(on_tick);

	ios.run();
	sender_work.reset();
	sender_ios.stop();
	sender_thread.join();

	std::printf("lost %d messages sent by the sender, %d sent by the receiver\n"
		, sender_link->lost(), receiver_link->lost());
	if (!storage->last_saved_path().empty())
		std::printf("saved as \"%s\"\n", storage->last_saved_path().c_str());
	return storage->last_saved_path().empty() ? 1 : 0;
}
catch (std::exception const& e)
{
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}
