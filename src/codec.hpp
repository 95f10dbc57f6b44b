#pragma once
#include <string>

// Standard base64, no line breaks.
std::string base64_encode(const std::string& in);

// Ignores ASCII whitespace (the contents API wraps at 60 columns).
// Throws FormatError on characters outside the alphabet or bad padding.
std::string base64_decode(const std::string& in);

// Overwrites the string's bytes in place before it is dropped.
void wipe(std::string& s);
