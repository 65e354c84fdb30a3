#include "event_log.h"

#include <iostream>

EventLog::EventLog() : m_readCursor(0), m_echo(false) {}

void EventLog::addEvent(const std::string& event) {
    m_events.push_back(event);
    if (m_echo) {
        std::cout << event << "\n";
    }
}

void EventLog::setEcho(bool echo) {
    m_echo = echo;
}

std::vector<std::string> EventLog::takeNew() {
    std::vector<std::string> out(m_events.begin() + static_cast<std::ptrdiff_t>(m_readCursor), m_events.end());
    m_readCursor = m_events.size();
    return out;
}

const std::vector<std::string>& EventLog::takeAll() {
    m_readCursor = m_events.size();
    return m_events;
}
