/**
 * @file risk_model_factory.cpp
 * @brief Implementation of risk model factory
 */

#include "risk/risk_model_factory.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tailrisk
{
    namespace risk
    {

        // RiskModelConfig implementation
        RiskModelConfig RiskModelConfig::from_json(const nlohmann::json &doc)
        {
            RiskModelConfig config;

            if (doc.contains("type"))
            {
                if (!doc["type"].is_string())
                {
                    throw std::invalid_argument("Risk model 'type' must be a string");
                }
                config.type = doc["type"].get<std::string>();
            }

            if (doc.contains("ewma_lambda"))
            {
                config.ewma_lambda = doc["ewma_lambda"].get<double>();
            }

            if (doc.contains("seed_window"))
            {
                config.seed_window = doc["seed_window"].get<int>();
            }

            if (doc.contains("bias_correction"))
            {
                config.bias_correction = doc["bias_correction"].get<bool>();
            }

            return config;
        }

        nlohmann::json RiskModelConfig::to_json() const
        {
            return nlohmann::json{
                {"type", type},
                {"ewma_lambda", ewma_lambda},
                {"seed_window", seed_window},
                {"bias_correction", bias_correction}};
        }

        // RiskModelFactory implementation
        std::string RiskModelFactory::normalize_type(const std::string &type)
        {
            std::string normalized = type;

            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create(const RiskModelConfig &config)
        {
            std::string type = normalize_type(config.type);

            if (type == "sample" || type == "sample_covariance")
            {
                return std::make_unique<SampleCovariance>(config.bias_correction);
            }
            else if (type == "ewma" || type == "ewma_covariance")
            {
                return std::make_unique<EWMACovariance>(config.ewma_lambda, config.seed_window);
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown risk model type: '" + config.type + "'. "
                                                                 "Valid options: ewma, sample");
            }
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create(const std::string &type, const nlohmann::json &params)
        {
            nlohmann::json config_json = params;
            config_json["type"] = type;

            RiskModelConfig config = RiskModelConfig::from_json(config_json);
            return create(config);
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create_sample_covariance(bool bias_correction)
        {
            return std::make_unique<SampleCovariance>(bias_correction);
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create_ewma_covariance(double lambda, int seed_window)
        {
            return std::make_unique<EWMACovariance>(lambda, seed_window);
        }

        std::vector<std::string> RiskModelFactory::get_supported_types()
        {
            return {
                "ewma",
                "ewma_covariance",
                "sample",
                "sample_covariance"};
        }

    } // namespace risk
} // namespace tailrisk
