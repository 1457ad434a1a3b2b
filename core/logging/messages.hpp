#ifndef __MESSAGES_HPP_
#define __MESSAGES_HPP_

#include <stdint.h>

#define MAX_LOG_PAYLOAD    120

static constexpr const char *log_type_name[] = {
	"PRESSURE",
	"ERROR",
	"WARN",
	"INFO",
	"TRACE"
};

enum LogType : uint8_t {
	LOG_PRESSURE,
	LOG_ERROR,
	LOG_WARN,
	LOG_INFO,
	LOG_TRACE
};

static_assert(sizeof(log_type_name) / sizeof(log_type_name[0]) == LOG_TRACE + 1, "log_type_name out of step with LogType");

struct __attribute__((packed)) LogHeader {
	uint8_t  day;
	uint8_t  month;
	uint16_t year;
	uint8_t  hours;
	uint8_t  minutes;
	uint8_t  seconds;
	LogType  log_type;
	uint8_t  payload_size;
};

struct LogEntry {
	LogHeader header;
	uint8_t data[MAX_LOG_PAYLOAD];
};

struct __attribute__((packed)) PressureLogEntry {
	LogHeader header;
	union {
		struct {
			double pressure;     // hPa
			double temperature;  // deg C
			uint8_t full_scale;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

#endif // __MESSAGES_HPP_
