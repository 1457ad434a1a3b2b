#pragma once

// Logical device mappings for a Linux host with the sensor on an i2c-dev bus
#define EXT_I2C_BUS        "/dev/i2c-1"
#define LPS28_DEVICE       EXT_I2C_BUS

// I2C bus addresses
#define LPS28_ADDRESS      0x5D   // SA0 high

// Sampling defaults for lps28_tool
#define LPS28_DEFAULT_SAMPLES      1
#define LPS28_DEFAULT_RATE_HZ      10
