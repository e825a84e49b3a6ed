#include "sweeper/ai/random_source.h"

#include <random>

namespace sweeper {
namespace ai {

namespace {

class EngineRandomSource : public RandomSource {
 public:
  explicit EngineRandomSource(unsigned seed) : engine_(seed) {}

  ~EngineRandomSource() final = default;

  std::size_t Uniform(std::size_t n) final {
    std::uniform_int_distribution<std::size_t> d(0, n - 1);
    return d(engine_);
  }

 private:
  std::default_random_engine engine_;
};

}  // namespace

std::unique_ptr<RandomSource> NewRandomSource(unsigned seed) {
  return std::unique_ptr<RandomSource>(new EngineRandomSource(seed));
}

}  // namespace ai
}  // namespace sweeper
