#include "runtime/rent_calculator.h"

namespace palisade {
namespace runtime {

RentCalculator::RentCalculator(const RentConfig &config) : config_(config) {}

RentCalculator::RentCalculator() : config_(RentConfig()) {}

RentCalculator RentCalculator::from_config(const RuntimeConfig &config) {
  return RentCalculator(
      RentConfig(config.lamports_per_byte_year, config.exemption_threshold));
}

Lamports RentCalculator::minimum_balance(size_t data_size) const {
  Lamports yearly_rent =
      static_cast<Lamports>(ACCOUNT_STORAGE_OVERHEAD + data_size) *
      config_.lamports_per_byte_year;

  // Exemption threshold is expressed in years of rent
  return static_cast<Lamports>(static_cast<double>(yearly_rent) *
                               config_.exemption_threshold);
}

bool RentCalculator::is_rent_exempt(Lamports balance, size_t data_size) const {
  return balance >= minimum_balance(data_size);
}

} // namespace runtime
} // namespace palisade
