#ifndef SWEEPER_AI_RANDOM_SOURCE_H_
#define SWEEPER_AI_RANDOM_SOURCE_H_

#include <cstddef>
#include <memory>

namespace sweeper {
namespace ai {

// A source of uniformly distributed indexes.
//
// Tests substitute a scripted implementation to make random moves
// reproducible.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Returns an index in [0, n). Must not be called with n == 0.
  virtual std::size_t Uniform(std::size_t n) = 0;
};

// Returns a RandomSource backed by a seeded std::default_random_engine.
std::unique_ptr<RandomSource> NewRandomSource(unsigned seed);

}  // namespace ai
}  // namespace sweeper

#endif  // SWEEPER_AI_RANDOM_SOURCE_H_
