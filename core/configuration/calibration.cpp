#include "calibration.hpp"
#include "debug.hpp"
#include "error.hpp"

void CalibratableManager::add(Calibratable& s, const char *name) {
	if (m_map.count(std::string(name))) {
		DEBUG_ERROR("CalibratableManager::add: %s already registered", name);
		throw ErrorCode::KEY_ALREADY_EXISTS; // Don't allow duplicate keys
	}
	m_map.insert({std::string(name), s});
}

void CalibratableManager::remove(Calibratable& s) {
	for (auto const &p : m_map) {
		if (&p.second == &s) {
			m_map.erase(p.first);
			return;
		}
	}
	throw ErrorCode::KEY_DOES_NOT_EXIST; // Don't allow a remove that doesn't exist
}

Calibratable &CalibratableManager::find_by_name(const char *name) {
	auto it = m_map.find(std::string(name));
	if (it == m_map.end())
		throw ErrorCode::KEY_DOES_NOT_EXIST;
	return it->second;
}
