#include "countmap/key_loader.hpp"

#include <array>
#include <fstream>
#include <iostream>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include "countmap/common.hpp"

namespace {

std::ifstream OpenFile(std::string_view path) {
  std::ifstream in{std::string{path}, std::ios::binary};
  if (not in) {
    std::cerr << "Failed to open file: '" << path << "'." << std::endl;
    Fail("Failed to open file: '" + std::string{path} + "'.");
  }
  return in;
}

}  // namespace

std::vector<std::string> ReadKeys(std::istream& in) {
  std::vector<std::string> result;
  std::string key;
  while (in >> key) {
    result.push_back(key);
  }
  if (in.bad()) {
    Fail("Error while reading keys");
  }
  return result;
}

bool IsGzipped(std::string_view path) {
  std::ifstream in = OpenFile(path);
  std::array<char, 2> header{};
  if (not in.read(header.data(), header.size())) {
    return false;
  }
  constexpr const unsigned char HeaderMagic0 = 0x1f;
  constexpr const unsigned char HeaderMagic1 = 0x8b;
  return static_cast<unsigned char>(header[0]) == HeaderMagic0 and
         static_cast<unsigned char>(header[1]) == HeaderMagic1;
}

std::vector<std::string> LoadKeys(std::string_view path) {
  if (IsGzipped(path)) {
    std::ifstream file = OpenFile(path);
    boost::iostreams::filtering_istream in;
    in.push(boost::iostreams::gzip_decompressor());
    in.push(file);
    in.exceptions(std::ios::badbit);
    try {
      return ReadKeys(in);
    } catch (const boost::iostreams::gzip_error& e) {
      std::cerr << "Corrupt gzip stream in '" << path << "': " << e.what() << std::endl;
      Fail("Corrupt gzip stream in '" + std::string{path} + "'.");
    }
  }
  std::ifstream file = OpenFile(path);
  return ReadKeys(file);
}
