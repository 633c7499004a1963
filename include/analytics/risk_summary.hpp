/**
 * @file risk_summary.hpp
 * @brief One-shot tail risk report for a panel and a set of weights.
 *
 * Runs every model of the engine on the same inputs:
 * - per-asset static Student-t table, ranked by ES95
 * - static-t, GARCH-t and historical portfolio measures (returns)
 * - Monte Carlo t-copula measures per horizon (notional PnL)
 * - component ES (1-day simulation) and component VaR (historical)
 *
 * A failure while fitting one asset is recorded on that asset's row;
 * failures at the portfolio level propagate to the caller.
 */

#ifndef TAILRISK_ANALYTICS_RISK_SUMMARY_HPP
#define TAILRISK_ANALYTICS_RISK_SUMMARY_HPP

#include "analytics/risk_contribution.hpp"
#include "data/return_panel.hpp"
#include "marginal/garch_fitter.hpp"
#include "marginal/student_t_fitter.hpp"
#include "portfolio/portfolio_var_model.hpp"
#include "risk/risk_model_factory.hpp"
#include "simulation/t_copula_engine.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tailrisk
{
    namespace analytics
    {

        /**
         * @struct AssetRiskRow
         * @brief Static Student-t fit of one asset.
         */
        struct AssetRiskRow
        {
            std::string ticker;
            bool ok = false;
            std::string error; ///< Failure message when !ok
            double mean = std::numeric_limits<double>::quiet_NaN();
            double stdev = std::numeric_limits<double>::quiet_NaN();
            double nu = std::numeric_limits<double>::quiet_NaN();
            double var95 = std::numeric_limits<double>::quiet_NaN();
            double var99 = std::numeric_limits<double>::quiet_NaN();
            double es95 = std::numeric_limits<double>::quiet_NaN();
            double es99 = std::numeric_limits<double>::quiet_NaN();

            nlohmann::json to_json() const;
        };

        /**
         * @struct HorizonMeasures
         * @brief Simulated PnL measures for one horizon.
         */
        struct HorizonMeasures
        {
            int horizon_days = 1;
            portfolio::TailRiskMeasures pnl;
        };

        /**
         * @struct RiskSummaryConfig
         * @brief Settings of every model the summary runs.
         */
        struct RiskSummaryConfig
        {
            marginal::StudentTFitConfig student_t;
            std::uint64_t seed = 42; ///< Seed of the static Student-t fits
            marginal::GarchConfig garch;
            risk::RiskModelConfig dependence;
            simulation::MonteCarloConfig monte_carlo;
            int top_n = 5; ///< Size of the worst / best lists
            bool verbose = false;

            void validate() const;
        };

        /**
         * @struct RiskSummary
         * @brief Output of RiskSummaryBuilder::build
         */
        struct RiskSummary
        {
            double notional = 0.0;
            std::vector<std::string> tickers;
            Eigen::VectorXd weights; ///< Normalized weights

            std::vector<AssetRiskRow> assets; ///< Panel order
            std::vector<AssetRiskRow> worst;  ///< Lowest ES95 first
            std::vector<AssetRiskRow> best;   ///< Highest ES95 last

            double static_nu = std::numeric_limits<double>::quiet_NaN();
            portfolio::TailRiskMeasures static_t;

            double garch_nu = std::numeric_limits<double>::quiet_NaN();
            bool garch_converged = true;
            int garch_fallbacks = 0;
            portfolio::TailRiskMeasures garch_t;

            portfolio::TailRiskMeasures historical;

            std::vector<HorizonMeasures> monte_carlo;

            RiskContribution component_es;
            RiskContribution component_var;

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskSummaryBuilder
         * @brief Orchestrates all models for one (panel, weights) run.
         *
         * Usage:
         * @code
         *   RiskSummaryBuilder builder(config);
         *   RiskSummary summary = builder.build(panel, weights);
         *   print_summary(summary, std::cout);
         * @endcode
         */
        class RiskSummaryBuilder
        {
        public:
            explicit RiskSummaryBuilder(const RiskSummaryConfig &config = RiskSummaryConfig());

            /**
             * @brief Run every model.
             * @param panel Complete return panel.
             * @param weights Panel-aligned weights; normalized to sum to one.
             * @throws std::invalid_argument on bad inputs
             * @throws NumericalError if the dependence matrix cannot be factored
             */
            RiskSummary build(const ReturnPanel &panel, const Eigen::VectorXd &weights) const;

            /**
             * @brief Per-asset static Student-t rows.
             *
             * One generator seeded with config.seed is shared across the
             * assets in panel order, so a row depends on the assets before it.
             */
            std::vector<AssetRiskRow> asset_table(const ReturnPanel &panel) const;

            const RiskSummaryConfig &get_config() const { return config_; }

        private:
            RiskSummaryConfig config_;

            void rank_assets(RiskSummary &summary) const;
        };

        /**
         * @brief Human readable report of a summary.
         */
        void print_summary(const RiskSummary &summary, std::ostream &os);

    } // namespace analytics
} // namespace tailrisk

#endif // TAILRISK_ANALYTICS_RISK_SUMMARY_HPP
