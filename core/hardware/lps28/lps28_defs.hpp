#pragma once

#include <stdint.h>

// Register map as named in the ILPS28QSW datasheet
enum class LPS28Reg : uint8_t {
	INTERRUPT_CFG = 0x0B,
	THS_P_L = 0x0C,
	THS_P_H = 0x0D,
	IF_CTRL = 0x0E,
	WHO_AM_I = 0x0F,                // Read-only
	CTRL_REG1 = 0x10,
	CTRL_REG2 = 0x11,
	CTRL_REG3 = 0x12,
	FIFO_CTRL = 0x14,
	FIFO_WTM = 0x15,
	REF_P_L = 0x16,                 // Read-only
	REF_P_H = 0x17,                 // Read-only
	I3C_IF_CTRL = 0x19,
	RPDS_L = 0x1A,
	RPDS_H = 0x1B,
	INT_SOURCE = 0x24,              // Read-only
	FIFO_STATUS1 = 0x25,            // Read-only
	FIFO_STATUS2 = 0x26,            // Read-only
	STATUS = 0x27,                  // Read-only
	PRESS_OUT_XL = 0x28,            // Read-only
	PRESS_OUT_L = 0x29,             // Read-only
	PRESS_OUT_H = 0x2A,             // Read-only
	TEMP_OUT_L = 0x2B,              // Read-only
	TEMP_OUT_H = 0x2C,              // Read-only
	FIFO_DATA_OUT_PRESS_XL = 0x78,  // Read-only
	FIFO_DATA_OUT_PRESS_L = 0x79,   // Read-only
	FIFO_DATA_OUT_PRESS_H = 0x7A    // Read-only
};

static constexpr uint8_t LPS28_WHO_AM_I_VALUE = 0xB4;
static constexpr uint8_t LPS28_DEFAULT_ADDRESS = 0x5D;

enum class LPS28Access : uint8_t {
	RO,
	RW
};

struct LPS28BitField {
	LPS28Reg reg;
	uint8_t offset;
	uint8_t width;
	LPS28Access access;
};

// Index into lps28_fields[]; order must match the table below
enum class LPS28Field : unsigned int {
	DATA_RATE,
	RESOLUTION,
	FULL_SCALE,
	BLOCK_DATA_UPDATE,
	SOFTWARE_RESET,
	ONE_SHOT_TRIGGER,
	HIGH_THRESHOLD_ENABLE,
	LOW_THRESHOLD_ENABLE,
	INTERRUPT_LATCH,
	HIGH_THRESHOLD_EXCEEDED,
	LOW_THRESHOLD_EXCEEDED,
	INTERRUPT_ACTIVE,
	PRESSURE_AVAILABLE,
	TEMPERATURE_AVAILABLE,
	NUM_FIELDS
};

// CTRL_REG1 (0x10)
// | ---- | ODR(3) | ODR(2) | ODR(1) | ODR(0) | AVG(2) | AVG(1) | AVG(0) |
// CTRL_REG2 (0x11)
// | BOOT | FS_MODE | LFPF_CFG | EN_LPFP | BDU | SWRESET | ---- | ONESHOT |
// INTERRUPT_CFG (0x0B)
// | AUTOREFP | RESET_ARP | AUTOZERO | RESET_AZ | ---- | LIR | PLE | PHE |
// INT_SOURCE (0x24)
// | BOOT_ON | ---- | ---- | ---- | ---- | IA | PL | PH |
// STATUS (0x27)
// | ---- | ---- | T_OR | P_OR | ---- | ---- | T_DA | P_DA |
static constexpr LPS28BitField lps28_fields[] = {
	{ LPS28Reg::CTRL_REG1,     3, 4, LPS28Access::RW },  // DATA_RATE
	{ LPS28Reg::CTRL_REG1,     0, 3, LPS28Access::RW },  // RESOLUTION
	{ LPS28Reg::CTRL_REG2,     6, 1, LPS28Access::RW },  // FULL_SCALE
	{ LPS28Reg::CTRL_REG2,     3, 1, LPS28Access::RW },  // BLOCK_DATA_UPDATE
	{ LPS28Reg::CTRL_REG2,     2, 1, LPS28Access::RW },  // SOFTWARE_RESET
	{ LPS28Reg::CTRL_REG2,     0, 1, LPS28Access::RW },  // ONE_SHOT_TRIGGER
	{ LPS28Reg::INTERRUPT_CFG, 0, 1, LPS28Access::RW },  // HIGH_THRESHOLD_ENABLE
	{ LPS28Reg::INTERRUPT_CFG, 1, 1, LPS28Access::RW },  // LOW_THRESHOLD_ENABLE
	{ LPS28Reg::INTERRUPT_CFG, 2, 1, LPS28Access::RW },  // INTERRUPT_LATCH
	{ LPS28Reg::INT_SOURCE,    0, 1, LPS28Access::RO },  // HIGH_THRESHOLD_EXCEEDED
	{ LPS28Reg::INT_SOURCE,    1, 1, LPS28Access::RO },  // LOW_THRESHOLD_EXCEEDED
	{ LPS28Reg::INT_SOURCE,    2, 1, LPS28Access::RO },  // INTERRUPT_ACTIVE
	{ LPS28Reg::STATUS,        0, 1, LPS28Access::RO },  // PRESSURE_AVAILABLE
	{ LPS28Reg::STATUS,        1, 1, LPS28Access::RO },  // TEMPERATURE_AVAILABLE
};

static_assert(sizeof(lps28_fields) / sizeof(lps28_fields[0]) == static_cast<unsigned int>(LPS28Field::NUM_FIELDS),
		"lps28_fields[] does not match LPS28Field");
