#ifndef __PMU_HPP_
#define __PMU_HPP_

extern "C" {
#include <unistd.h>
}

class PMU {
public:
	static void delay_ms(unsigned int ms) {
		usleep(ms * 1000);
	}
};

#endif // __PMU_HPP_
