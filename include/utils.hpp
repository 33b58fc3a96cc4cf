#pragma once

#include <cstdint>
#include <string>
#include <vector>

float rms(const std::vector<float>& x);
float dbfs(const std::vector<float>& x);

void write_file(const std::string& path, const std::vector<uint8_t>& bytes);
