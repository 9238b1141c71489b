#ifndef UUID_GENERATOR_HPP
#define UUID_GENERATOR_HPP

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <string>

class UuidGenerator {
 public:
  // Random (v4) uuid. One generator per I/O thread, seeding is costly.
  static std::string generate_uuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
  }
};

#endif  // UUID_GENERATOR_HPP
