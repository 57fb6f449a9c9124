#pragma once

#include "common/config.h"
#include "common/types.h"

namespace palisade {
namespace runtime {

using namespace palisade::common;

/**
 * Rent-exemption calculator handed to handlers by the host
 */
class RentCalculator {
public:
    // Default rent configuration based on Solana mainnet
    static constexpr Lamports DEFAULT_LAMPORTS_PER_BYTE_YEAR = 3480;
    static constexpr double DEFAULT_EXEMPTION_THRESHOLD = 2.0;

    /// Bytes charged for every account on top of its data
    static constexpr size_t ACCOUNT_STORAGE_OVERHEAD = 128;

    struct RentConfig {
        Lamports lamports_per_byte_year = DEFAULT_LAMPORTS_PER_BYTE_YEAR;
        double exemption_threshold = DEFAULT_EXEMPTION_THRESHOLD;

        RentConfig() = default;
        RentConfig(Lamports per_byte, double threshold)
            : lamports_per_byte_year(per_byte), exemption_threshold(threshold) {}
    };

    explicit RentCalculator(const RentConfig& config);
    RentCalculator();
    ~RentCalculator() = default;

    static RentCalculator from_config(const RuntimeConfig& config);

    /**
     * Minimum balance for an account holding data_size bytes to be rent exempt
     */
    Lamports minimum_balance(size_t data_size) const;

    bool is_rent_exempt(Lamports balance, size_t data_size) const;

    const RentConfig& get_config() const { return config_; }

private:
    RentConfig config_;
};

} // namespace runtime
} // namespace palisade
