#include "sensor.hpp"
#include "debug.hpp"

Sensor::Sensor(const char *name) : Calibratable(name) {
	DEBUG_TRACE("Sensor::Sensor(%s)", name);
	SensorManager::add(*this, name);
}

Sensor::~Sensor() {
	SensorManager::remove(*this);
}
