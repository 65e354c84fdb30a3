#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Append-only record of every state transition in a game.
class EventLog {
public:
    EventLog();

    void addEvent(const std::string& event);
    void setEcho(bool echo);
    const std::vector<std::string>& getEvents() const { return m_events; }
    std::size_t size() const { return m_events.size(); }

    // Entries appended since the previous takeNew()/takeAll() call.
    std::vector<std::string> takeNew();
    // Whole log; also moves the read cursor to the end.
    const std::vector<std::string>& takeAll();

private:
    std::vector<std::string> m_events;
    std::size_t m_readCursor;
    bool m_echo;
};
