#ifndef _I2C_HPP__
#define _I2C_HPP__

#include <stdint.h>

// Register-addressed I2C transport.  Implementations throw
// ErrorCode::I2C_COMMS_ERROR on any bus failure (NACK, timeout, short transfer).
class I2C {
public:
	virtual ~I2C() {}
	virtual void read(uint8_t address, uint8_t reg, uint8_t *buffer, unsigned int length) = 0;
	virtual void write(uint8_t address, uint8_t reg, const uint8_t *buffer, unsigned int length) = 0;
};

#endif // _I2C_HPP__
