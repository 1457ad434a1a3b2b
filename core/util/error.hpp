#ifndef __ERROR_HPP_
#define __ERROR_HPP_

enum ErrorCode : int {
	RESOURCE_NOT_AVAILABLE = -1,
	KEY_ALREADY_EXISTS = -2,
	KEY_DOES_NOT_EXIST = -3,
	I2C_COMMS_ERROR = -4,
	DEVICE_NOT_FOUND = -5,
	INVALID_SETTING = -6,
	BAD_REGISTER_VALUE = -7,
	BAD_SENSOR_CHANNEL = -8,
	BAD_PARAMETER = -9
};

#endif // __ERROR_HPP_
