#pragma once
#include <string>
#include <vector>

std::vector<unsigned char> sha512(const std::vector<unsigned char>& data);
std::vector<unsigned char> sha512_file(const std::string& path);
std::string hex_encode(const std::vector<unsigned char>& data);
