#include <cstdlib>
#include <cstring>
#include <map>

extern "C" {
#include <getopt.h>
}

#include "bsp.hpp"
#include "pmu.hpp"
#include "linux_i2c.hpp"
#include "lps28.hpp"
#include "console_log.hpp"
#include "debug.hpp"
#include "error.hpp"


static void usage(const char *prog) {
	printf("usage: %s [-b bus] [-a address] [-r rate_hz] [-n samples] [-f] [-v]\r\n", prog);
	printf("  -b  i2c-dev bus (default %s)\r\n", LPS28_DEVICE);
	printf("  -a  device address (default 0x%02x)\r\n", LPS28_ADDRESS);
	printf("  -r  output data rate in Hz: 1 4 10 25 50 75 100 200 (default %u)\r\n", LPS28_DEFAULT_RATE_HZ);
	printf("  -n  number of samples (default %u)\r\n", LPS28_DEFAULT_SAMPLES);
	printf("  -f  extended full scale (4060 hPa)\r\n");
	printf("  -v  trace register access\r\n");
}

int main(int argc, char **argv) {
	ConsoleLog con_log;
	con_log.set_log_level(LOG_LEVEL_INFO);
	DebugLogger::console_log = &con_log;

	const std::map<unsigned int, LPS28DataRate> rate_map = {
		{1, LPS28DataRate::RATE_1_HZ}, {4, LPS28DataRate::RATE_4_HZ}, {10, LPS28DataRate::RATE_10_HZ},
		{25, LPS28DataRate::RATE_25_HZ}, {50, LPS28DataRate::RATE_50_HZ}, {75, LPS28DataRate::RATE_75_HZ},
		{100, LPS28DataRate::RATE_100_HZ}, {200, LPS28DataRate::RATE_200_HZ}
	};

	const char *bus = LPS28_DEVICE;
	unsigned int address = LPS28_ADDRESS;
	unsigned int rate_hz = LPS28_DEFAULT_RATE_HZ;
	unsigned int samples = LPS28_DEFAULT_SAMPLES;
	bool extended = false;

	int opt;
	while ((opt = getopt(argc, argv, "b:a:r:n:fvh")) != -1) {
		switch (opt) {
		case 'b':
			bus = optarg;
			break;
		case 'a':
			address = std::strtoul(optarg, nullptr, 0);
			break;
		case 'r':
			rate_hz = std::strtoul(optarg, nullptr, 0);
			break;
		case 'n':
			samples = std::strtoul(optarg, nullptr, 0);
			break;
		case 'f':
			extended = true;
			break;
		case 'v':
			con_log.set_log_level(LOG_LEVEL_DEBUG);
			break;
		case 'h':
		default:
			usage(argv[0]);
			return opt == 'h' ? EXIT_SUCCESS : EXIT_FAILURE;
		}
	}

	auto rate = rate_map.find(rate_hz);
	if (rate == rate_map.end() || address > 0x7F) {
		usage(argv[0]);
		return EXIT_FAILURE;
	}

	try {
		LinuxI2C i2c(bus);
		LPS28 lps28(i2c, (uint8_t)address);

		lps28.set_block_data_update(true);
		lps28.set_full_scale(extended ? LPS28FullScale::EXTENDED : LPS28FullScale::NORMAL);
		lps28.set_data_rate(rate->second);

		for (unsigned int i = 0; i < samples; i++) {
			PMU::delay_ms(1000 / rate_hz);

			PressureLogEntry entry;
			entry.header.log_type = LOG_PRESSURE;
			entry.header.payload_size = sizeof(entry.pressure) + sizeof(entry.temperature) + sizeof(entry.full_scale);
			Logger::sync_datetime(entry.header);
			entry.pressure = lps28.get_pressure();
			entry.temperature = lps28.get_temperature();
			entry.full_scale = static_cast<uint8_t>(extended ? LPS28FullScale::EXTENDED : LPS28FullScale::NORMAL);
			con_log.write(&entry);
		}
	} catch (ErrorCode e) {
		DEBUG_ERROR("lps28_tool: failed with error %d", (int)e);
		fprintf(stderr, "lps28_tool: error %d\r\n", (int)e);
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
