/**
 * @file t_copula_engine.hpp
 * @brief Monte Carlo portfolio PnL with a Student-t copula
 *
 * Scenario generation for a horizon of h days:
 *
 * 1. Estimate the dependence (EWMA by default) and factor the correlation,
 *    corr = L * L^T. A correlation that cannot be factored is fatal.
 * 2. Draw N ~ N(0, I) (n_sims x d) and g ~ chi2(nu_c) / nu_c (n_sims), then
 *    Z = (N * L^T) / sqrt(g), a multivariate t(nu_c) with correlation corr.
 * 3. Map each Z to the t(nu_m) margin through U = t_cdf(Z; nu_c) and
 *    X = t_quantile(U; nu_m).
 * 4. Rescale to unit variance, X / sqrt(nu_m / (nu_m - 2)), then
 *    r = mu * h + X * vol * sqrt(h) with mu the sample mean of each asset.
 * 5. Aggregate r * w and multiply by the notional.
 *
 * All draws are made up front as dense matrices and the correlated draw is a
 * single matrix product. The generator is seeded from the configuration, so
 * identical inputs produce identical PnL vectors.
 */

#ifndef TAILRISK_SIMULATION_T_COPULA_ENGINE_HPP
#define TAILRISK_SIMULATION_T_COPULA_ENGINE_HPP

#include "data/return_panel.hpp"
#include "portfolio/portfolio_var_model.hpp"
#include "risk/risk_model.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <random>
#include <utility>
#include <vector>

namespace tailrisk
{
    namespace simulation
    {

        /**
         * @struct MonteCarloConfig
         * @brief Simulation settings
         */
        struct MonteCarloConfig
        {
            double notional = 1000000.0;    ///< Portfolio value the PnL is expressed in
            int n_sims = 100000;            ///< Number of scenarios
            std::vector<int> horizons{1, 10}; ///< Horizons (days) reported by the summary
            double nu_copula = 5.0;         ///< Degrees of freedom of the copula
            double nu_marginal = 5.0;       ///< Degrees of freedom of every margin
            std::uint64_t seed = 42;        ///< Generator seed
            bool verbose = false;

            /**
             * @throws std::invalid_argument on non-positive counts, horizons or nu_copula
             * @throws tailrisk::NumericalError if nu_marginal <= 2
             */
            void validate() const;

            static MonteCarloConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct SimulationResult
         * @brief Scenario matrix and its aggregation
         */
        struct SimulationResult
        {
            Eigen::MatrixXd asset_returns;     ///< n_sims x d simulated horizon returns
            Eigen::VectorXd portfolio_returns; ///< asset_returns * w
            Eigen::VectorXd pnl;               ///< notional * portfolio_returns
            Eigen::VectorXd weights;           ///< Normalized weights used
            int horizon_days = 1;
        };

        /**
         * @class TCopulaEngine
         * @brief t-copula Monte Carlo simulator
         *
         * Usage Example:
         * @code
         * TCopulaEngine engine(MonteCarloConfig{});
         * Eigen::VectorXd pnl = engine.simulate_pnl(panel, weights, 10);
         * auto var_es = TCopulaEngine::var_cvar(pnl, 0.99);
         * @endcode
         */
        class TCopulaEngine
        {
        public:
            /**
             * @param config Simulation settings
             * @param dependence_model Covariance model (EWMA with lambda 0.94 if null)
             * @throws std::invalid_argument / tailrisk::NumericalError if the config is invalid
             */
            explicit TCopulaEngine(const MonteCarloConfig &config = MonteCarloConfig(),
                                   std::unique_ptr<risk::RiskModel> dependence_model = nullptr);

            /**
             * @brief Simulate per-asset horizon returns
             * @param panel Historical returns
             * @param horizon_days Horizon h (>= 1)
             * @param rng Generator all draws are taken from
             * @return n_sims x d matrix of simulated returns
             * @throws tailrisk::NumericalError if the correlation is not positive definite
             */
            Eigen::MatrixXd simulate_asset_returns(const ReturnPanel &panel,
                                                   int horizon_days,
                                                   std::mt19937_64 &rng) const;

            /**
             * @brief Full simulation with a generator seeded from the config
             * @throws std::invalid_argument if weights do not match or sum to zero
             */
            SimulationResult simulate(const ReturnPanel &panel,
                                      const Eigen::VectorXd &weights,
                                      int horizon_days) const;

            /**
             * @brief Simulated portfolio PnL (length n_sims)
             */
            Eigen::VectorXd simulate_pnl(const ReturnPanel &panel,
                                         const Eigen::VectorXd &weights,
                                         int horizon_days) const;

            /**
             * @brief VaR and CVaR of a PnL sample
             *
             * VaR is the (1 - confidence) empirical quantile; CVaR is the mean
             * of PnL at or below VaR, or VaR itself if that tail is empty.
             *
             * @param pnl PnL sample (losses negative)
             * @param confidence Confidence level in (0, 1), e.g. 0.99
             * @throws std::invalid_argument if pnl is empty or confidence out of range
             */
            static std::pair<double, double> var_cvar(const Eigen::VectorXd &pnl, double confidence);

            /**
             * @brief 95% and 99% VaR / CVaR of a PnL sample
             */
            static portfolio::TailRiskMeasures measures(const Eigen::VectorXd &pnl);

            const MonteCarloConfig &get_config() const { return config_; }

            const risk::RiskModel &get_dependence_model() const { return *dependence_model_; }

        private:
            MonteCarloConfig config_;
            std::unique_ptr<risk::RiskModel> dependence_model_;

            /**
             * @brief Map copula draws to unit-variance t(nu_marginal) margins
             */
            Eigen::MatrixXd transform_margins(const Eigen::MatrixXd &z) const;
        };

    } // namespace simulation
} // namespace tailrisk

#endif // TAILRISK_SIMULATION_T_COPULA_ENGINE_HPP
