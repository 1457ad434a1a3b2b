#include <cstring>
#include <type_traits>

extern "C" {
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <sys/ioctl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
}

#include "linux_i2c.hpp"
#include "error.hpp"
#include "debug.hpp"

// The descriptor is closed exactly once, by the owning instance
static_assert(!std::is_copy_constructible<LinuxI2C>::value && !std::is_copy_assignable<LinuxI2C>::value,
	"LinuxI2C must not be copyable");

LinuxI2C::LinuxI2C(const char *device) : m_device(device) {
	m_fd = ::open(device, O_RDWR);
	if (m_fd < 0) {
		DEBUG_ERROR("LinuxI2C::LinuxI2C: open(%s) failed: %s", device, std::strerror(errno));
		throw ErrorCode::RESOURCE_NOT_AVAILABLE;
	}
	DEBUG_TRACE("LinuxI2C::LinuxI2C(%s) fd=%d", device, m_fd);
}

LinuxI2C::~LinuxI2C() {
	::close(m_fd);
}

void LinuxI2C::read(uint8_t address, uint8_t reg, uint8_t *buffer, unsigned int length) {
	struct i2c_msg msgs[2];
	struct i2c_rdwr_ioctl_data xfer;

	msgs[0].addr = address;
	msgs[0].flags = 0;
	msgs[0].len = sizeof(reg);
	msgs[0].buf = &reg;
	msgs[1].addr = address;
	msgs[1].flags = I2C_M_RD;
	msgs[1].len = length;
	msgs[1].buf = buffer;
	xfer.msgs = msgs;
	xfer.nmsgs = 2;

	if (ioctl(m_fd, I2C_RDWR, &xfer) < 0) {
		DEBUG_ERROR("LinuxI2C::read(%s,%02x,%02x,%u)=%s", m_device.c_str(), (unsigned int)address, (unsigned int)reg, length, std::strerror(errno));
		throw ErrorCode::I2C_COMMS_ERROR;
	}
}

void LinuxI2C::write(uint8_t address, uint8_t reg, const uint8_t *buffer, unsigned int length) {
	if (length > MAX_WRITE_LENGTH)
		throw ErrorCode::BAD_PARAMETER;

	uint8_t tx[MAX_WRITE_LENGTH + 1];
	tx[0] = reg;
	std::memcpy(&tx[1], buffer, length);

	struct i2c_msg msg;
	struct i2c_rdwr_ioctl_data xfer;

	msg.addr = address;
	msg.flags = 0;
	msg.len = length + 1;
	msg.buf = tx;
	xfer.msgs = &msg;
	xfer.nmsgs = 1;

	if (ioctl(m_fd, I2C_RDWR, &xfer) < 0) {
		DEBUG_ERROR("LinuxI2C::write(%s,%02x,%02x,%u)=%s", m_device.c_str(), (unsigned int)address, (unsigned int)reg, length, std::strerror(errno));
		throw ErrorCode::I2C_COMMS_ERROR;
	}
}
