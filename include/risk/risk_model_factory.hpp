/**
 * @file risk_model_factory.hpp
 * @brief Factory for creating dependence estimators from configuration
 *
 * Reads the "dependence" section of the engine configuration:
 *
 * @code{.json}
 * {
 *   "dependence": {
 *     "type": "ewma",
 *     "ewma_lambda": 0.94,
 *     "seed_window": 30,
 *     "bias_correction": true
 *   }
 * }
 * @endcode
 */

#pragma once

#include "risk/risk_model.hpp"
#include "risk/sample_covariance.hpp"
#include "risk/ewma_covariance.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace tailrisk
{
    namespace risk
    {

        /**
         * @struct RiskModelConfig
         * @brief Configuration parameters for covariance model creation
         *
         * Unused parameters are ignored based on the model type.
         */
        struct RiskModelConfig
        {
            /**
             * @brief Type of risk model
             *
             * Supported values (case-insensitive):
             * - "ewma" or "ewma_covariance": EWMACovariance (default)
             * - "sample" or "sample_covariance": SampleCovariance
             */
            std::string type = "ewma";

            /// EWMA decay, valid range (0, 1)
            double ewma_lambda = 0.94;

            /// Observations used to seed the EWMA recursion
            int seed_window = 30;

            /// Bessel's correction for SampleCovariance
            bool bias_correction = true;

            /**
             * @brief Create configuration from JSON
             *
             * Missing fields keep their defaults.
             *
             * @throws nlohmann::json::exception if a field has the wrong type
             */
            static RiskModelConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskModelFactory
         * @brief Factory for creating risk model instances
         *
         * Usage Pattern:
         * @code
         * auto config = RiskModelConfig::from_json(json_obj["dependence"]);
         * auto model = RiskModelFactory::create(config);
         * auto dep = model->estimate_dependence(returns);
         * @endcode
         */
        class RiskModelFactory
        {
        public:
            /**
             * @brief Create risk model from configuration
             * @throws std::invalid_argument if type is unknown or parameters are invalid
             */
            static std::unique_ptr<RiskModel> create(const RiskModelConfig &config);

            /**
             * @brief Create risk model from type string and JSON parameters
             * @throws std::invalid_argument if type is unknown
             */
            static std::unique_ptr<RiskModel> create(
                const std::string &type,
                const nlohmann::json &params);

            static std::unique_ptr<RiskModel> create_sample_covariance(
                bool bias_correction = true);

            /**
             * @brief Create EWMA covariance estimator
             * @throws std::invalid_argument if lambda not in (0, 1) or seed_window < 2
             */
            static std::unique_ptr<RiskModel> create_ewma_covariance(
                double lambda = 0.94, int seed_window = 30);

            /**
             * @brief Get list of supported risk model types
             */
            static std::vector<std::string> get_supported_types();

        private:
            /**
             * @brief Normalize type string (lowercase)
             */
            static std::string normalize_type(const std::string &type);
        };

    } // namespace risk
} // namespace tailrisk
