#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace search {

/*
 * Accumulated statistic of a node, from the point of view of the node's owner.
 *
 * mean() is a utility in [0, 1] (0 worst, 1 best). Valuations are compared by mean, then by
 * total_playouts.
 */
class Valuation {
 public:
  virtual ~Valuation() = default;

  virtual double mean() const = 0;
  virtual int64_t total_playouts() const = 0;

  // Merges one more simulation result.
  virtual void propagate(double utility) = 0;

  // Merges the statistics of other.
  virtual void propagate(const Valuation& other) = 0;

  virtual std::unique_ptr<Valuation> clone() const = 0;
  virtual std::string to_string() const;

  bool operator<(const Valuation& other) const;
};

class NormalizedUtilityValuation : public Valuation {
 public:
  explicit NormalizedUtilityValuation(double utility, int64_t total_playouts = 1);

  double mean() const override { return utility_; }
  int64_t total_playouts() const override { return total_playouts_; }

  void propagate(double utility) override;
  void propagate(const Valuation& other) override;

  std::unique_ptr<Valuation> clone() const override;

 private:
  double utility_;
  int64_t total_playouts_;
};

// Wraps the utility of a node's first simulation into its Valuation.
class ValuationFactory {
 public:
  virtual ~ValuationFactory() = default;
  virtual std::unique_ptr<Valuation> make(double utility) const = 0;
};

class NormalizedUtilityValuationFactory : public ValuationFactory {
 public:
  std::unique_ptr<Valuation> make(double utility) const override {
    return std::make_unique<NormalizedUtilityValuation>(utility);
  }
};

}  // namespace search
