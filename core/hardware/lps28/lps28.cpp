#include <cmath>
#include <limits>

#include "lps28.hpp"
#include "error.hpp"
#include "debug.hpp"


LPS28::LPS28(I2C& bus, uint8_t address, const char *name) : Sensor(name), m_bus(bus), m_addr(address),
		m_pressure_scale(NORMAL_PRESSURE_SCALE)
{
	DEBUG_TRACE("LPS28::LPS28(i2caddr=0x%02x)", (unsigned int)address);

	uint8_t device_id = read_reg(LPS28Reg::WHO_AM_I);
	if (device_id != LPS28_WHO_AM_I_VALUE) {
		DEBUG_ERROR("LPS28::LPS28: WHO_AM_I=0x%02x expected 0x%02x", (unsigned int)device_id, (unsigned int)LPS28_WHO_AM_I_VALUE);
		throw ErrorCode::DEVICE_NOT_FOUND;
	}

	// Configuration survives a driver restart so pick up FS_MODE from the device
	// rather than assuming the power-on default
	m_pressure_scale = read_field(LPS28Field::FULL_SCALE) ? EXTENDED_PRESSURE_SCALE : NORMAL_PRESSURE_SCALE;

	// Device powers up in one-shot mode
	set_data_rate(LPS28DataRate::RATE_10_HZ);

	DEBUG_INFO("LPS28::LPS28: found device at 0x%02x", (unsigned int)address);
}

void LPS28::read_reg(LPS28Reg reg, uint8_t *data, unsigned int len)
{
	m_bus.read(m_addr, static_cast<uint8_t>(reg), data, len);
	DEBUG_TRACE("LPS28::read_reg(%02x, %u)=%02x", (unsigned int)reg, len, (unsigned int)data[0]);
}

uint8_t LPS28::read_reg(LPS28Reg reg)
{
	uint8_t value;
	read_reg(reg, &value, sizeof(value));
	return value;
}

void LPS28::write_reg(LPS28Reg reg, const uint8_t *data, unsigned int len)
{
	DEBUG_TRACE("LPS28::write_reg(%02x, %u)=%02x", (unsigned int)reg, len, (unsigned int)data[0]);
	m_bus.write(m_addr, static_cast<uint8_t>(reg), data, len);
}

void LPS28::write_reg(LPS28Reg reg, uint8_t value)
{
	write_reg(reg, &value, sizeof(value));
}

unsigned int LPS28::read_field(LPS28Field field)
{
	const LPS28BitField &f = lps28_fields[static_cast<unsigned int>(field)];
	const unsigned int mask = (1U << f.width) - 1;
	return (read_reg(f.reg) >> f.offset) & mask;
}

void LPS28::write_field(LPS28Field field, unsigned int value)
{
	const LPS28BitField &f = lps28_fields[static_cast<unsigned int>(field)];
	const unsigned int mask = (1U << f.width) - 1;

	if (f.access != LPS28Access::RW || value > mask) {
		DEBUG_ERROR("LPS28::write_field: field %u rejected value %u", static_cast<unsigned int>(field), value);
		throw ErrorCode::INVALID_SETTING;
	}

	uint8_t reg_value = read_reg(f.reg);
	reg_value &= ~(mask << f.offset);
	reg_value |= (value << f.offset);
	write_reg(f.reg, reg_value);
}

unsigned int LPS28::threshold_scale() const
{
	return m_pressure_scale == NORMAL_PRESSURE_SCALE ? NORMAL_THRESHOLD_SCALE : EXTENDED_THRESHOLD_SCALE;
}

int32_t LPS28::twos_complement(uint32_t value, unsigned int bits)
{
	if (value & (1UL << (bits - 1)))
		return (int32_t)((int64_t)value - ((int64_t)1 << bits));
	return (int32_t)value;
}

bool LPS28::is_valid(LPS28DataRate rate)
{
	switch (rate) {
	case LPS28DataRate::ONE_SHOT:
	case LPS28DataRate::RATE_1_HZ:
	case LPS28DataRate::RATE_4_HZ:
	case LPS28DataRate::RATE_10_HZ:
	case LPS28DataRate::RATE_25_HZ:
	case LPS28DataRate::RATE_50_HZ:
	case LPS28DataRate::RATE_75_HZ:
	case LPS28DataRate::RATE_100_HZ:
	case LPS28DataRate::RATE_200_HZ:
		return true;
	default:
		return false;
	}
}

bool LPS28::is_valid(LPS28Resolution resolution)
{
	switch (resolution) {
	case LPS28Resolution::RES_4:
	case LPS28Resolution::RES_8:
	case LPS28Resolution::RES_16:
	case LPS28Resolution::RES_32:
	case LPS28Resolution::RES_64:
	case LPS28Resolution::RES_128:
	case LPS28Resolution::RES_512:
		return true;
	default:
		return false;
	}
}

bool LPS28::is_valid(LPS28FullScale full_scale)
{
	return full_scale == LPS28FullScale::NORMAL || full_scale == LPS28FullScale::EXTENDED;
}

LPS28DataRate LPS28::get_data_rate()
{
	LPS28DataRate rate = static_cast<LPS28DataRate>(read_field(LPS28Field::DATA_RATE));
	if (!is_valid(rate)) {
		DEBUG_ERROR("LPS28::get_data_rate: unknown ODR code %u", static_cast<unsigned int>(rate));
		throw ErrorCode::BAD_REGISTER_VALUE;
	}
	return rate;
}

void LPS28::set_data_rate(LPS28DataRate rate)
{
	if (!is_valid(rate)) {
		DEBUG_ERROR("LPS28::set_data_rate: invalid setting %u", static_cast<unsigned int>(rate));
		throw ErrorCode::INVALID_SETTING;
	}
	write_field(LPS28Field::DATA_RATE, static_cast<unsigned int>(rate));
}

LPS28Resolution LPS28::get_resolution()
{
	LPS28Resolution resolution = static_cast<LPS28Resolution>(read_field(LPS28Field::RESOLUTION));
	if (!is_valid(resolution)) {
		DEBUG_ERROR("LPS28::get_resolution: unknown AVG code %u", static_cast<unsigned int>(resolution));
		throw ErrorCode::BAD_REGISTER_VALUE;
	}
	return resolution;
}

void LPS28::set_resolution(LPS28Resolution resolution)
{
	if (!is_valid(resolution)) {
		DEBUG_ERROR("LPS28::set_resolution: invalid setting %u", static_cast<unsigned int>(resolution));
		throw ErrorCode::INVALID_SETTING;
	}
	write_field(LPS28Field::RESOLUTION, static_cast<unsigned int>(resolution));
}

LPS28FullScale LPS28::get_full_scale()
{
	return static_cast<LPS28FullScale>(read_field(LPS28Field::FULL_SCALE));
}

void LPS28::set_full_scale(LPS28FullScale full_scale)
{
	if (!is_valid(full_scale)) {
		DEBUG_ERROR("LPS28::set_full_scale: invalid setting %u", static_cast<unsigned int>(full_scale));
		throw ErrorCode::INVALID_SETTING;
	}

	// Scale only changes once the register write has gone through
	write_field(LPS28Field::FULL_SCALE, static_cast<unsigned int>(full_scale));
	m_pressure_scale = (full_scale == LPS28FullScale::EXTENDED) ? EXTENDED_PRESSURE_SCALE : NORMAL_PRESSURE_SCALE;
}

double LPS28::get_pressure()
{
	uint8_t buffer[3];
	read_reg(LPS28Reg::PRESS_OUT_XL, buffer, sizeof(buffer));

	uint32_t raw = ((uint32_t)buffer[2] << 16) | ((uint32_t)buffer[1] << 8) | buffer[0];
	double pressure = (double)twos_complement(raw, 24) / m_pressure_scale;

	DEBUG_TRACE("LPS28::get_pressure: raw=%06x %f hPa", (unsigned int)raw, pressure);
	return pressure;
}

double LPS28::get_temperature()
{
	uint8_t buffer[2];
	read_reg(LPS28Reg::TEMP_OUT_L, buffer, sizeof(buffer));

	int16_t raw = (int16_t)(((uint16_t)buffer[1] << 8) | buffer[0]);
	return raw / 100.0;
}

bool LPS28::get_high_threshold_enabled()
{
	return read_field(LPS28Field::HIGH_THRESHOLD_ENABLE);
}

void LPS28::set_high_threshold_enabled(bool enable)
{
	write_field(LPS28Field::HIGH_THRESHOLD_ENABLE, enable);
}

bool LPS28::get_low_threshold_enabled()
{
	return read_field(LPS28Field::LOW_THRESHOLD_ENABLE);
}

void LPS28::set_low_threshold_enabled(bool enable)
{
	write_field(LPS28Field::LOW_THRESHOLD_ENABLE, enable);
}

bool LPS28::get_high_threshold_exceeded()
{
	return read_field(LPS28Field::HIGH_THRESHOLD_EXCEEDED);
}

bool LPS28::get_low_threshold_exceeded()
{
	return read_field(LPS28Field::LOW_THRESHOLD_EXCEEDED);
}

double LPS28::get_pressure_threshold()
{
	uint8_t buffer[2];
	read_reg(LPS28Reg::THS_P_L, buffer, sizeof(buffer));

	uint16_t raw = ((uint16_t)buffer[1] << 8) | buffer[0];
	return (double)raw / threshold_scale();
}

void LPS28::set_pressure_threshold(double threshold)
{
	if (!std::isfinite(threshold)) {
		DEBUG_ERROR("LPS28::set_pressure_threshold: non-finite threshold");
		throw ErrorCode::INVALID_SETTING;
	}

	// Only the low 16 bits reach the device
	double wrapped = std::fmod(std::round(threshold * threshold_scale()), 65536.0);
	if (wrapped < 0)
		wrapped += 65536.0;
	uint16_t raw = (uint16_t)wrapped;
	uint8_t buffer[2] = { (uint8_t)(raw & 0xFF), (uint8_t)(raw >> 8) };

	DEBUG_TRACE("LPS28::set_pressure_threshold: %f hPa raw=%04x", threshold, (unsigned int)raw);
	write_reg(LPS28Reg::THS_P_L, buffer, sizeof(buffer));
}

bool LPS28::get_interrupt_latched()
{
	return read_field(LPS28Field::INTERRUPT_LATCH);
}

void LPS28::set_interrupt_latched(bool latched)
{
	write_field(LPS28Field::INTERRUPT_LATCH, latched);
}

bool LPS28::get_interrupt_active()
{
	return read_field(LPS28Field::INTERRUPT_ACTIVE);
}

bool LPS28::get_block_data_update()
{
	return read_field(LPS28Field::BLOCK_DATA_UPDATE);
}

void LPS28::set_block_data_update(bool enable)
{
	write_field(LPS28Field::BLOCK_DATA_UPDATE, enable);
}

bool LPS28::get_pressure_data_available()
{
	return read_field(LPS28Field::PRESSURE_AVAILABLE);
}

bool LPS28::get_temperature_data_available()
{
	return read_field(LPS28Field::TEMPERATURE_AVAILABLE);
}

void LPS28::trigger_one_shot()
{
	if (get_data_rate() != LPS28DataRate::ONE_SHOT) {
		DEBUG_ERROR("LPS28::trigger_one_shot: device is sampling continuously");
		throw ErrorCode::INVALID_SETTING;
	}
	write_field(LPS28Field::ONE_SHOT_TRIGGER, 1);
}

void LPS28::software_reset()
{
	DEBUG_INFO("LPS28::software_reset");
	write_field(LPS28Field::SOFTWARE_RESET, 1);

	// Reset returns FS_MODE to zero
	m_pressure_scale = NORMAL_PRESSURE_SCALE;
}

double LPS28::get_pressure_offset()
{
	uint8_t buffer[2];
	read_reg(LPS28Reg::RPDS_L, buffer, sizeof(buffer));

	int16_t raw = (int16_t)(((uint16_t)buffer[1] << 8) | buffer[0]);
	return (double)raw / threshold_scale();
}

void LPS28::set_pressure_offset(double offset)
{
	if (!std::isfinite(offset)) {
		DEBUG_ERROR("LPS28::set_pressure_offset: non-finite offset");
		throw ErrorCode::INVALID_SETTING;
	}

	double scaled = std::round(offset * threshold_scale());
	if (scaled < std::numeric_limits<int16_t>::min() || scaled > std::numeric_limits<int16_t>::max()) {
		DEBUG_ERROR("LPS28::set_pressure_offset: %f hPa out of range", offset);
		throw ErrorCode::INVALID_SETTING;
	}

	uint16_t value = (uint16_t)(int16_t)scaled;
	uint8_t buffer[2] = { (uint8_t)(value & 0xFF), (uint8_t)(value >> 8) };
	write_reg(LPS28Reg::RPDS_L, buffer, sizeof(buffer));
}

double LPS28::read(unsigned int port)
{
	if (port == static_cast<unsigned int>(LPS28SensorPort::PRESSURE))
		return get_pressure();
	else if (port == static_cast<unsigned int>(LPS28SensorPort::TEMPERATURE))
		return get_temperature();
	throw ErrorCode::BAD_SENSOR_CHANNEL;
}

void LPS28::calibration_write(const double value, const unsigned int offset)
{
	if (offset != static_cast<unsigned int>(LPS28CalibrationOffset::PRESSURE_OFFSET))
		throw ErrorCode::BAD_SENSOR_CHANNEL;
	set_pressure_offset(value);
}

void LPS28::calibration_read(double &value, const unsigned int offset)
{
	if (offset != static_cast<unsigned int>(LPS28CalibrationOffset::PRESSURE_OFFSET))
		throw ErrorCode::BAD_SENSOR_CHANNEL;
	value = get_pressure_offset();
}
