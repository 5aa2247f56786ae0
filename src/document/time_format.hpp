#pragma once

#include <string>

// "MM:SS", or "HH:MM:SS" from one hour on. Negative input renders as 00:00.
std::string format_clock(double seconds);

// SubRip timestamp "HH:MM:SS,mmm".
std::string format_srt_time(double seconds);

// Rough duration for humans: "~42 seconds", "~7 minutes", "~1.5 hours".
std::string format_estimate(double seconds);

// Local time as "DD/MM/YYYY HH:MM".
std::string format_local_now();
