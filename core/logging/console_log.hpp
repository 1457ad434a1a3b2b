#ifndef __CONSOLE_LOG_HPP_
#define __CONSOLE_LOG_HPP_

#include <stdio.h>

#include "logger.hpp"
#include "messages.hpp"


class ConsoleLog : public Logger {

public:
	ConsoleLog() : Logger("Console") {}

private:
	void debug_formatter(const char *level, LogHeader *header, const char *msg) {
		printf("%02u/%02u/%04u %02u:%02u:%02u [%s]\t%s\r\n", header->day, header->month, header->year, header->hours, header->minutes, header->seconds, level, msg);
	}
	void pressure_formatter(const PressureLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tpressure: %.4f hPa temperature: %.2f C full_scale: %u\r\n", name, entry->pressure, entry->temperature, (unsigned int)entry->full_scale);
	}

public:
	void create() override {}
	void truncate() override {}
	bool is_ready() override { return true; }
	unsigned int num_entries() override {return 0;}
	void read(void *, int) override { }
	void write(void *entry) override {
		LogEntry *p = (LogEntry *)entry;
		switch (p->header.log_type) {
		case LOG_ERROR:
		case LOG_WARN:
		case LOG_INFO:
		case LOG_TRACE:
			debug_formatter(log_type_name[p->header.log_type], &p->header, (const char * )p->data);
			break;
		case LOG_PRESSURE:
			pressure_formatter((const PressureLogEntry *)entry);
			break;
		default:
			// Not yet supported
			break;
		}
	}
};

#endif // __CONSOLE_LOG_HPP_
