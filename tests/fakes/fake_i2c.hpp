#pragma once

#include <cstring>
#include <cstdint>
#include "i2c.hpp"
#include "error.hpp"

// Register file behind a single device address.  Multi-byte accesses
// auto-increment the register address as the LPS28 does.
class FakeI2C : public I2C {
private:
	uint8_t m_address;

public:
	uint8_t regs[256];
	unsigned int num_reads;
	unsigned int num_writes;
	unsigned int writes_to[256];
	bool fail;

	FakeI2C(uint8_t address = 0x5D) : m_address(address) {
		reset();
	}

	void reset() {
		std::memset(regs, 0, sizeof(regs));
		std::memset(writes_to, 0, sizeof(writes_to));
		num_reads = 0;
		num_writes = 0;
		fail = false;
	}

	void read(uint8_t address, uint8_t reg, uint8_t *buffer, unsigned int length) override {
		if (fail || address != m_address)
			throw ErrorCode::I2C_COMMS_ERROR;
		num_reads++;
		for (unsigned int i = 0; i < length; i++)
			buffer[i] = regs[(reg + i) & 0xFF];
	}

	void write(uint8_t address, uint8_t reg, const uint8_t *buffer, unsigned int length) override {
		if (fail || address != m_address)
			throw ErrorCode::I2C_COMMS_ERROR;
		num_writes++;
		for (unsigned int i = 0; i < length; i++) {
			regs[(reg + i) & 0xFF] = buffer[i];
			writes_to[(reg + i) & 0xFF]++;
		}
	}
};
