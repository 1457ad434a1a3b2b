#pragma once

#include <cstdint>
#include <string>

#include "i2c.hpp"

// I2C transport over the Linux i2c-dev interface.  Each register access is a
// single I2C_RDWR transaction so a read uses a repeated start.
class LinuxI2C : public I2C {
public:
	LinuxI2C(const char *device);
	LinuxI2C(const LinuxI2C&) = delete;
	LinuxI2C& operator=(const LinuxI2C&) = delete;
	~LinuxI2C();
	void read(uint8_t address, uint8_t reg, uint8_t *buffer, unsigned int length) override;
	void write(uint8_t address, uint8_t reg, const uint8_t *buffer, unsigned int length) override;

private:
	static constexpr unsigned int MAX_WRITE_LENGTH = 32;
	int m_fd;
	std::string m_device;
};
