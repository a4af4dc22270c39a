#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <vector>

namespace sj {
/// \brief Handle returned on registering a listener, used to remove it.
using ListenerId = std::uint64_t;

/// \brief Listener registry for an enum-tagged event vocabulary.
/// Named listeners receive the payload of one event,
/// catch-all listeners receive every event tag along with its payload.
/// On fire, named listeners are invoked before catch-all listeners, each in registration order.
/// Listeners must not be added or removed while an event is being dispatched.
template <typename EventT, typename... Args>
class EventSource {
  public:
	using Event = EventT;
	using Listener = std::function<void(Args...)>;
	using CatchAllListener = std::function<void(EventT, Args...)>;

	/// \brief Register a listener for one event.
	/// \returns Id to pass to remove_listener().
	auto add_listener(EventT const event, Listener listener) -> ListenerId {
		auto const id = ++m_prev_id;
		m_listeners.push_back(Named{.id = id, .event = event, .callback = std::move(listener)});
		return id;
	}

	/// \brief Register a listener for every event.
	/// \returns Id to pass to remove_listener().
	auto add_catch_all_listener(CatchAllListener listener) -> ListenerId {
		auto const id = ++m_prev_id;
		m_catch_alls.push_back(CatchAll{.id = id, .callback = std::move(listener)});
		return id;
	}

	/// \brief Remove a named or catch-all listener.
	/// \returns true if a listener was removed.
	auto remove_listener(ListenerId const id) -> bool {
		auto const has_id = [id](auto const& entry) { return entry.id == id; };
		return std::erase_if(m_listeners, has_id) + std::erase_if(m_catch_alls, has_id) > 0;
	}

	/// \brief Remove all named listeners of an event.
	void clear_listeners(EventT const event) {
		std::erase_if(m_listeners, [event](Named const& entry) { return entry.event == event; });
	}

	/// \brief Remove all named and catch-all listeners.
	void clear_listeners() {
		m_listeners.clear();
		m_catch_alls.clear();
	}

	[[nodiscard]] auto listener_count() const -> std::size_t { return m_listeners.size() + m_catch_alls.size(); }

  protected:
	void fire(EventT const event, Args... args) const {
		for (std::size_t i = 0; i < m_listeners.size(); ++i) {
			if (m_listeners[i].event == event) { m_listeners[i].callback(args...); }
		}
		for (std::size_t i = 0; i < m_catch_alls.size(); ++i) { m_catch_alls[i].callback(event, args...); }
	}

  private:
	struct Named {
		ListenerId id{};
		EventT event{};
		Listener callback{};
	};

	struct CatchAll {
		ListenerId id{};
		CatchAllListener callback{};
	};

	std::vector<Named> m_listeners{};
	std::vector<CatchAll> m_catch_alls{};
	ListenerId m_prev_id{};
};
} // namespace sj
