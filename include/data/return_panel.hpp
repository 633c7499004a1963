/*
 * @file return_panel.hpp
 * @brief Immutable multi-asset log-return panel and weight alignment.
 *
 * The panel stores returns as an Eigen matrix (dates x assets) together with
 * its date index and ticker columns. It is the single input shared by every
 * estimator in the engine and cannot be modified after construction.
 */

#ifndef TAILRISK_DATA_RETURN_PANEL_HPP
#define TAILRISK_DATA_RETURN_PANEL_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace tailrisk
{

    /**
     * @class ReturnPanel
     * @brief T x N matrix of daily log returns with date and ticker indices.
     *
     * @note Construction rejects NaN/Inf entries: the engine expects a
     *       complete panel, gaps are handled by the ingestion layer.
     */
    class ReturnPanel
    {
    public:
        /**
         * @brief Constructor with data.
         * @param returns Return matrix (dates x assets).
         * @param dates Vector of date strings (YYYY-MM-DD), one per row.
         * @param tickers Vector of asset ticker symbols, one per column.
         * @throws std::invalid_argument if the matrix is empty, dimensions do
         *         not match, tickers are duplicated or values are not finite.
         */
        ReturnPanel(const Eigen::MatrixXd &returns,
                    const std::vector<std::string> &dates,
                    const std::vector<std::string> &tickers);

        ~ReturnPanel() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Eigen::MatrixXd &returns() const
        {
            return returns_;
        }

        const std::vector<std::string> &dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return returns_.rows();
        }

        size_t num_assets() const
        {
            return returns_.cols();
        }

        /**
         * @brief Get the return series of one asset.
         * @param ticker Asset ticker symbol.
         * @throws std::invalid_argument if the ticker is unknown.
         */
        Eigen::VectorXd asset_returns(const std::string &ticker) const;

        /**
         * @brief Column index of a ticker, or -1 if absent.
         */
        int find_ticker_index(const std::string &ticker) const;

        /** ===========================================
         *  Derived Series
         *  ===========================================
         */

        /**
         * @brief Weighted portfolio return per date (R * w).
         * @param weights Weight vector aligned to tickers().
         * @throws std::invalid_argument on a size mismatch.
         */
        Eigen::VectorXd portfolio_returns(const Eigen::VectorXd &weights) const;

        /**
         * @brief Restrict the panel to an inclusive date range.
         * @param start_date First date kept (empty = no lower bound).
         * @param end_date Last date kept (empty = no upper bound).
         * @throws std::invalid_argument if no date falls in the range.
         */
        ReturnPanel filter_by_date(const std::string &start_date,
                                   const std::string &end_date) const;

        /**
         * @brief Keep the last n observations.
         * @throws std::invalid_argument if n is zero.
         */
        ReturnPanel tail(size_t n) const;

        /**
         * @brief Build a panel of log returns from a price matrix.
         *
         * r_t = log(P_t / P_{t-1}). The first date is consumed. Missing prices
         * are forward-filled first; rows still lacking a return for any asset
         * (leading gaps) are dropped since the estimators need a complete panel.
         *
         * @param prices Price matrix (dates x assets), NaN for missing.
         * @param dates Date strings aligned with price rows.
         * @param tickers Ticker symbols aligned with price columns.
         * @throws std::invalid_argument if no complete return row remains.
         */
        static ReturnPanel from_prices(const Eigen::MatrixXd &prices,
                                       const std::vector<std::string> &dates,
                                       const std::vector<std::string> &tickers);

    private:
        Eigen::MatrixXd returns_;                    ///< Return matrix (dates x assets)
        std::vector<std::string> dates_;             ///< Date strings
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::map<std::string, size_t> ticker_index_; ///< Ticker to column map
    };

    /**
     * @brief Align a ticker->weight mapping to the panel universe.
     *
     * Tickers absent from the panel are dropped, panel tickers missing from
     * the mapping receive an explicit zero, and the result is renormalized
     * to sum to one.
     *
     * @param weights Raw weight mapping (signed weights are allowed).
     * @param tickers Panel tickers defining the output order.
     * @return Weight vector aligned with tickers.
     * @throws std::invalid_argument if the aligned weights sum to zero.
     */
    Eigen::VectorXd align_weights(const std::map<std::string, double> &weights,
                                  const std::vector<std::string> &tickers);

    /**
     * @brief Renormalize an already aligned weight vector to sum to one.
     * @throws std::invalid_argument if the vector is empty, not finite or sums to zero.
     */
    Eigen::VectorXd normalize_weights(const Eigen::VectorXd &weights);

} // namespace tailrisk

#endif // TAILRISK_DATA_RETURN_PANEL_HPP
