#pragma once

#include <string>
#include <map>

class Calibratable;


class CalibratableManager {
private:
	static inline std::map<std::string, Calibratable&> m_map;

public:
	static void add(Calibratable& s, const char *name);
	static void remove(Calibratable& s);
	static Calibratable &find_by_name(const char *name);
};

// Calibration values are held by the device itself (e.g. an offset register),
// so there is no persistence at this layer
class Calibratable {
public:
	Calibratable(const char *name = "Calibratable") {
		CalibratableManager::add(*this, name);
	}
	Calibratable(const Calibratable&) = delete;
	Calibratable& operator=(const Calibratable&) = delete;
	virtual ~Calibratable() {
		CalibratableManager::remove(*this);
	}
	virtual void calibration_write(const double, const unsigned int) {};
	virtual void calibration_read(double &, const unsigned int) {};
};
