#pragma once

#include <chrono>
#include <cpuid.h>
#include <cstring>
#include <cctype>
#include <ostream>
#include <string>
#include <algorithm>
#include "data.hpp"


class StopWatch
{
public:
  StopWatch();

	void start();
	void stop();

	inline int64_t get_start_unix_time() {
		return this->start_time;
	}

	// Seconds between start and stop, or until now while running
	int64_t seconds() const;
	std::string duration_string() const;

	friend std::ostream& operator<<(std::ostream& os, const StopWatch& watch);

protected:
	int64_t start_time;
	int64_t end_time;
	bool running;
};


inline int64_t get_unix_time()
{
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}


template<class T>
inline T squared(T x)
{
	return x * x;
}


// Trim whitespace on both ends
inline std::string trim(std::string text)
{
	text.erase(text.begin(), std::find_if(text.begin(), text.end(), [](int ch) { return !std::isspace(ch); }));
	text.erase(std::find_if(text.rbegin(), text.rend(), [](int ch) { return !std::isspace(ch); }).base(), text.end());
	return text;
}


inline std::string get_cpu_name()
{
	// Linux CPU info based on https://stackoverflow.com/a/50021699
	char cpu_name[0x40];
	unsigned int cpu_info[4] = {0,0,0,0};

	__cpuid(0x80000000, cpu_info[0], cpu_info[1], cpu_info[2], cpu_info[3]);
	unsigned int nExIds = cpu_info[0];

	std::memset(cpu_name, 0, sizeof(cpu_name));

	for (unsigned int i = 0x80000000; i <= nExIds; ++i)
	{
			__cpuid(i, cpu_info[0], cpu_info[1], cpu_info[2], cpu_info[3]);

			if (i == 0x80000002)
					std::memcpy(cpu_name, cpu_info, sizeof(cpu_info));
			else if (i == 0x80000003)
					std::memcpy(cpu_name + 16, cpu_info, sizeof(cpu_info));
			else if (i == 0x80000004)
					std::memcpy(cpu_name + 32, cpu_info, sizeof(cpu_info));
	}

	return trim(static_cast<std::string>(cpu_name));
}
