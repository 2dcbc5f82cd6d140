#include "id.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <vector>

#include <openssl/rand.h>

#include "exception.hpp"

namespace ember {

namespace {

const std::array<const char *, 16> adjectives = {
    "brave",  "calm",   "eager", "fancy", "gentle", "happy",
    "jolly",  "kind",   "lively", "merry", "nimble", "proud",
    "quiet",  "silly",  "swift", "witty",
};

const std::array<const char *, 16> nouns = {
    "badger", "falcon", "gecko", "heron", "ibis",  "koala",
    "lemur",  "marten", "newt",  "otter", "panda", "quokka",
    "raven",  "stoat",  "tapir", "walrus",
};

std::vector<uint8_t> random_bytes(size_t n) {
  std::vector<uint8_t> buf(n);
  if (RAND_bytes(buf.data(), static_cast<int>(n)) != 1)
    throw exception<vmm_error>("RAND_bytes failed");
  return buf;
}

} // namespace

std::string generate_id(size_t nbytes) {
  std::string rv;
  rv.reserve(nbytes * 2);
  for (auto b : random_bytes(nbytes))
    rv += std::format("{:02x}", b);
  return rv;
}

std::string generate_name() {
  auto b = random_bytes(2);
  return std::format("{}-{}", adjectives[b[0] % adjectives.size()],
                     nouns[b[1] % nouns.size()]);
}

} // namespace ember
