#include <ctime>
#include <string>

#include "logger.hpp"


void Logger::sync_datetime(LogHeader &header) {
	std::time_t now = std::time(nullptr);
	std::tm tm;
	if (now != (std::time_t)-1 && gmtime_r(&now, &tm)) {
		header.year = tm.tm_year + 1900;
		header.month = tm.tm_mon + 1;
		header.day = tm.tm_mday;
		header.hours = tm.tm_hour;
		header.minutes = tm.tm_min;
		header.seconds = tm.tm_sec;
	}
	else
	{
		header.year = header.month = header.day = header.hours = header.minutes = header.seconds = 0;
	}
}

Logger::Logger(const char *name) {
	m_unique_id = LoggerManager::add(*this);
	m_name = name;
}

Logger::~Logger() {
	LoggerManager::remove(*this);
}

void Logger::set_log_level(int level) {
	m_log_level = level;
}

void Logger::format_and_write(LogType type, const char *msg, va_list args) {
	LogEntry buffer;
	vsnprintf(reinterpret_cast<char*>(buffer.data), sizeof(buffer.data), msg, args);
	buffer.header.log_type = type;
	buffer.header.payload_size = std::strlen(reinterpret_cast<char*>(buffer.data));
	sync_datetime(buffer.header);
	write(&buffer);
}

void Logger::warn(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_WARN) {
		va_list args;
		va_start(args, msg);
		format_and_write(LOG_WARN, msg, args);
		va_end(args);
	}
}

void Logger::error(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_ERROR) {
		va_list args;
		va_start(args, msg);
		format_and_write(LOG_ERROR, msg, args);
		va_end(args);
	}
}

void Logger::info(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		va_list args;
		va_start(args, msg);
		format_and_write(LOG_INFO, msg, args);
		va_end(args);
	}
}

void Logger::trace(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_DEBUG) {
		va_list args;
		va_start(args, msg);
		format_and_write(LOG_TRACE, msg, args);
		va_end(args);
	}
}

unsigned int Logger::get_unique_id() {
	return m_unique_id;
}

const char *Logger::get_name() {
	return m_name;
}

unsigned int LoggerManager::add(Logger& s) {
	m_map.insert({m_unique_identifier, s});
	return m_unique_identifier++;
}

void LoggerManager::remove(Logger& s) {
	m_map.erase(s.get_unique_id());
}

void LoggerManager::create() {
	for (auto const &s : m_map)
		s.second.create();
}

void LoggerManager::truncate()
{
	for (auto const &s : m_map)
		s.second.truncate();
}

Logger *LoggerManager::find_by_name(const char *name) {
	for (auto const &s : m_map) {
		if (std::string(name) == std::string(s.second.get_name()))
			return &s.second;
	}

	return nullptr;
}
