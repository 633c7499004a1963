/**
 * @file return_panel.cpp
 * @brief Implementation of ReturnPanel and weight alignment
 */

#include "data/return_panel.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tailrisk
{

    // ============================================================================
    // Constructors
    // ============================================================================

    ReturnPanel::ReturnPanel(const Eigen::MatrixXd &returns,
                             const std::vector<std::string> &dates,
                             const std::vector<std::string> &tickers)
        : returns_(returns), dates_(dates), tickers_(tickers)
    {
        if (returns_.rows() == 0 || returns_.cols() == 0)
        {
            throw std::invalid_argument("Return panel cannot be empty");
        }

        // Validate dimensions
        if (returns_.rows() != static_cast<int>(dates_.size()))
        {
            throw std::invalid_argument("Return matrix rows must match dates vector size");
        }
        if (returns_.cols() != static_cast<int>(tickers_.size()))
        {
            throw std::invalid_argument("Return matrix columns must match tickers vector size");
        }

        if (!returns_.allFinite())
        {
            throw std::invalid_argument("Return panel contains NaN or Inf values");
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            if (!ticker_index_.emplace(tickers_[i], i).second)
            {
                throw std::invalid_argument("Duplicate ticker in return panel: " + tickers_[i]);
            }
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    Eigen::VectorXd ReturnPanel::asset_returns(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return returns_.col(idx);
    }

    int ReturnPanel::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it == ticker_index_.end())
        {
            return -1;
        }
        return static_cast<int>(it->second);
    }

    // ============================================================================
    // Derived Series
    // ============================================================================

    Eigen::VectorXd ReturnPanel::portfolio_returns(const Eigen::VectorXd &weights) const
    {
        if (weights.size() != returns_.cols())
        {
            throw std::invalid_argument(
                "Weight vector size (" + std::to_string(weights.size()) +
                ") must match number of assets (" + std::to_string(returns_.cols()) + ")");
        }
        return returns_ * weights;
    }

    ReturnPanel ReturnPanel::filter_by_date(const std::string &start_date,
                                            const std::string &end_date) const
    {
        // ISO dates compare lexicographically
        std::vector<int> rows;
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if ((start_date.empty() || dates_[i] >= start_date) &&
                (end_date.empty() || dates_[i] <= end_date))
            {
                rows.push_back(static_cast<int>(i));
            }
        }

        if (rows.empty())
        {
            throw std::invalid_argument(
                "No observations between " + start_date + " and " + end_date);
        }

        Eigen::MatrixXd filtered(rows.size(), returns_.cols());
        std::vector<std::string> filtered_dates;
        filtered_dates.reserve(rows.size());

        for (size_t k = 0; k < rows.size(); ++k)
        {
            filtered.row(k) = returns_.row(rows[k]);
            filtered_dates.push_back(dates_[rows[k]]);
        }

        return ReturnPanel(filtered, filtered_dates, tickers_);
    }

    ReturnPanel ReturnPanel::tail(size_t n) const
    {
        if (n == 0)
        {
            throw std::invalid_argument("Tail length must be positive");
        }
        size_t keep = std::min(n, num_dates());
        size_t first = num_dates() - keep;

        std::vector<std::string> tail_dates(dates_.begin() + first, dates_.end());
        return ReturnPanel(returns_.bottomRows(keep), tail_dates, tickers_);
    }

    ReturnPanel ReturnPanel::from_prices(const Eigen::MatrixXd &prices,
                                         const std::vector<std::string> &dates,
                                         const std::vector<std::string> &tickers)
    {
        if (prices.rows() != static_cast<int>(dates.size()) ||
            prices.cols() != static_cast<int>(tickers.size()))
        {
            throw std::invalid_argument("Price matrix dimensions must match dates and tickers");
        }
        if (prices.rows() < 2)
        {
            throw std::invalid_argument("Need at least 2 price observations to calculate returns");
        }

        // Forward-fill gaps so a missing quote does not wipe out the date
        Eigen::MatrixXd filled = prices;
        for (int j = 0; j < filled.cols(); ++j)
        {
            for (int i = 1; i < filled.rows(); ++i)
            {
                if (std::isnan(filled(i, j)))
                {
                    filled(i, j) = filled(i - 1, j);
                }
            }
        }

        std::vector<Eigen::RowVectorXd> rows;
        std::vector<std::string> row_dates;

        for (int i = 1; i < filled.rows(); ++i)
        {
            Eigen::RowVectorXd r(filled.cols());
            bool complete = true;

            for (int j = 0; j < filled.cols(); ++j)
            {
                double p_t = filled(i, j);
                double p_tm1 = filled(i - 1, j);

                if (std::isnan(p_t) || std::isnan(p_tm1) || p_tm1 <= 0.0 || p_t <= 0.0)
                {
                    r(j) = std::numeric_limits<double>::quiet_NaN();
                    complete = false;
                }
                else
                {
                    r(j) = std::log(p_t / p_tm1);
                }
            }

            if (complete)
            {
                rows.push_back(r);
                row_dates.push_back(dates[i]);
            }
        }

        if (rows.empty())
        {
            throw std::invalid_argument("No complete return observations could be computed from prices");
        }

        Eigen::MatrixXd returns(rows.size(), filled.cols());
        for (size_t i = 0; i < rows.size(); ++i)
        {
            returns.row(i) = rows[i];
        }

        return ReturnPanel(returns, row_dates, tickers);
    }

    // ============================================================================
    // Weight Alignment
    // ============================================================================

    Eigen::VectorXd align_weights(const std::map<std::string, double> &weights,
                                  const std::vector<std::string> &tickers)
    {
        Eigen::VectorXd aligned = Eigen::VectorXd::Zero(tickers.size());

        for (size_t i = 0; i < tickers.size(); ++i)
        {
            auto it = weights.find(tickers[i]);
            if (it != weights.end())
            {
                aligned(i) = it->second;
            }
        }

        if (aligned.size() == 0 || aligned.sum() == 0.0)
        {
            throw std::invalid_argument(
                "All weights are zero after alignment - check that weight tickers match the return panel");
        }

        return normalize_weights(aligned);
    }

    Eigen::VectorXd normalize_weights(const Eigen::VectorXd &weights)
    {
        if (weights.size() == 0)
        {
            throw std::invalid_argument("Weight vector cannot be empty");
        }
        if (!weights.allFinite())
        {
            throw std::invalid_argument("Weight vector contains NaN or Inf values");
        }

        double total = weights.sum();
        if (total == 0.0)
        {
            throw std::invalid_argument("Weights sum to zero and cannot be normalized");
        }
        return weights / total;
    }

} // namespace tailrisk
