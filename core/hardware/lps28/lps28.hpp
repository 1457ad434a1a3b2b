#pragma once

#include <stdint.h>

#include "sensor.hpp"
#include "i2c.hpp"
#include "lps28_defs.hpp"

enum class LPS28DataRate : uint8_t {
	ONE_SHOT = 0b0000,
	RATE_1_HZ = 0b0001,
	RATE_4_HZ = 0b0010,
	RATE_10_HZ = 0b0011,
	RATE_25_HZ = 0b0100,
	RATE_50_HZ = 0b0101,
	RATE_75_HZ = 0b0110,
	RATE_100_HZ = 0b0111,
	RATE_200_HZ = 0b1000
};

// Number of samples averaged per output.  NB: 0b110 is reserved, RES_512 is 0b111
enum class LPS28Resolution : uint8_t {
	RES_4 = 0b000,
	RES_8 = 0b001,
	RES_16 = 0b010,
	RES_32 = 0b011,
	RES_64 = 0b100,
	RES_128 = 0b101,
	RES_512 = 0b111
};

enum class LPS28FullScale : uint8_t {
	NORMAL = 0b0,    // Up to 1260 hPa
	EXTENDED = 0b1   // Up to 4060 hPa
};

enum class LPS28SensorPort : unsigned int {
	PRESSURE,
	TEMPERATURE
};

enum class LPS28CalibrationOffset : unsigned int {
	PRESSURE_OFFSET
};

// Driver for the LPS28 pressure sensor.  The instance borrows the bus for its
// whole lifetime and performs no locking; all accessors block on the bus.
//
// The only state held here is the pressure scale (LSB/hPa) which always
// follows the FS_MODE bit last written by this driver.
class LPS28 : public Sensor {
public:
	static constexpr unsigned int NORMAL_PRESSURE_SCALE = 4096;
	static constexpr unsigned int EXTENDED_PRESSURE_SCALE = 2048;
	static constexpr unsigned int NORMAL_THRESHOLD_SCALE = 16;
	static constexpr unsigned int EXTENDED_THRESHOLD_SCALE = 8;

	// Throws DEVICE_NOT_FOUND if WHO_AM_I does not match.  On success the
	// device is left sampling continuously at 10 Hz.
	LPS28(I2C& bus, uint8_t address = LPS28_DEFAULT_ADDRESS, const char *name = "PRS");
	LPS28(const LPS28&) = delete;
	LPS28& operator=(const LPS28&) = delete;

	LPS28DataRate get_data_rate();
	void set_data_rate(LPS28DataRate rate);
	LPS28Resolution get_resolution();
	void set_resolution(LPS28Resolution resolution);
	LPS28FullScale get_full_scale();
	void set_full_scale(LPS28FullScale full_scale);

	double get_pressure();
	double get_temperature();

	bool get_high_threshold_enabled();
	void set_high_threshold_enabled(bool enable);
	bool get_low_threshold_enabled();
	void set_low_threshold_enabled(bool enable);
	bool get_high_threshold_exceeded();
	bool get_low_threshold_exceeded();

	// Threshold in hPa.  The register is not range checked: values that do
	// not fit in 16 bits wrap.  NaN and infinity throw INVALID_SETTING.
	double get_pressure_threshold();
	void set_pressure_threshold(double threshold);

	bool get_interrupt_latched();
	void set_interrupt_latched(bool latched);
	bool get_interrupt_active();
	bool get_block_data_update();
	void set_block_data_update(bool enable);
	bool get_pressure_data_available();
	bool get_temperature_data_available();
	void trigger_one_shot();
	void software_reset();

	// One point calibration offset (RPDS) in hPa
	double get_pressure_offset();
	void set_pressure_offset(double offset);

	unsigned int get_pressure_scale() const { return m_pressure_scale; }

	double read(unsigned int port = 0) override;
	void calibration_write(const double value, const unsigned int offset) override;
	void calibration_read(double &value, const unsigned int offset) override;

	static int32_t twos_complement(uint32_t value, unsigned int bits);
	static bool is_valid(LPS28DataRate rate);
	static bool is_valid(LPS28Resolution resolution);
	static bool is_valid(LPS28FullScale full_scale);

private:
	I2C& m_bus;
	uint8_t m_addr;
	unsigned int m_pressure_scale;

	void read_reg(LPS28Reg reg, uint8_t *data, unsigned int len);
	uint8_t read_reg(LPS28Reg reg);
	void write_reg(LPS28Reg reg, const uint8_t *data, unsigned int len);
	void write_reg(LPS28Reg reg, uint8_t value);
	unsigned int read_field(LPS28Field field);
	void write_field(LPS28Field field, unsigned int value);
	unsigned int threshold_scale() const;
};
