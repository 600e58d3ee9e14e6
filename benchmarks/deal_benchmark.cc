/**
 * @file deal_benchmark.cc
 * @brief Latency of the financing comparison and the lease grid search
 *
 * The engine reruns on every keystroke of the deal form, so these numbers
 * bound the recompute cost seen by the salesperson.
 */

#include "src/deal/deal_quote.hpp"
#include "src/finance/financing.hpp"
#include "src/lease/lease_grid.hpp"
#include <benchmark/benchmark.h>

using namespace dealcalc;

namespace {

struct DealFixture {
    VehicleProgram program;
    DealInputs inputs;
    LeaseMarket market;
};

const DealFixture& GetDealFixture() {
    static const DealFixture fixture = [] {
        DealFixture f;
        f.program.brand = "Jeep";
        f.program.model = "Grand Cherokee";
        f.program.trim = "Limited";
        f.program.year = 2025;
        f.program.consumer_cash = 2500.0;
        f.program.bonus_cash = 1000.0;
        f.program.option1_rates = RateTable::create(
            {{36, 3.99}, {48, 4.49}, {60, 4.99}, {72, 5.49}, {84, 5.99}, {96, 6.49}}).value();
        f.program.option2_rates = RateTable::create(
            {{36, 0.0}, {48, 0.99}, {60, 1.99}, {72, 2.99}}).value();

        f.inputs.vehicle_price = 58995.0;
        f.inputs.accessories = {{"Hitch", 650.0}, {"Mats", 250.0}};
        f.inputs.admin_fee = 799.0;
        f.inputs.tire_tax = 15.0;
        f.inputs.trade_in_value = 12000.0;
        f.inputs.trade_in_owed = 7000.0;
        f.inputs.down_payment = 3000.0;
        f.inputs.carried_balance = -1500.0;

        ResidualEntry residual;
        residual.brand = "Jeep";
        residual.model_name = "Grand Cherokee";
        residual.trim = "Limited";
        double pct = 64.0;
        for (int term : kLeaseTerms) {
            residual.residual_percentages[term] = pct;
            pct -= 2.5;
        }
        f.market.residuals.push_back(residual);

        LeaseRateEntry rates;
        rates.brand = "Jeep";
        rates.model = "Grand Cherokee Limited";
        for (int term : kLeaseTerms) {
            rates.standard_rates[term] = 5.99;
            rates.alternative_rates[term] = 2.49;
            f.market.km_adjustments.adjustments[MileageTier::Km12000][term] = 3.0;
            f.market.km_adjustments.adjustments[MileageTier::Km18000][term] = 1.5;
        }
        rates.lease_cash = 2000.0;
        f.market.lease_rates.by_year[2025] = {rates};
        return f;
    }();
    return fixture;
}

}  // namespace

static void BM_Financing_SingleTerm(benchmark::State& state) {
    const auto& f = GetDealFixture();
    for (auto _ : state) {
        auto result = compute_financing(f.program, f.inputs, 72);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("72 months, two options");
}
BENCHMARK(BM_Financing_SingleTerm);

static void BM_Financing_AllTerms(benchmark::State& state) {
    const auto& f = GetDealFixture();
    for (auto _ : state) {
        auto results = compare_financing_terms(f.program, f.inputs);
        benchmark::DoNotOptimize(results);
    }
    state.SetLabel("6 terms x 2 options");
}
BENCHMARK(BM_Financing_AllTerms);

static void BM_LeaseGrid(benchmark::State& state) {
    const auto& f = GetDealFixture();
    const auto& residual = f.market.residuals.front();
    const auto& rates = f.market.lease_rates.by_year.at(2025).front();
    for (auto _ : state) {
        auto grid = search_best_lease(residual, rates, f.market.km_adjustments, f.inputs,
                                      f.program.bonus_cash);
        benchmark::DoNotOptimize(grid);
    }
    state.SetLabel("9 terms x 3 tiers x 2 plans");
}
BENCHMARK(BM_LeaseGrid);

static void BM_QuoteDeal(benchmark::State& state) {
    const auto& f = GetDealFixture();
    LeaseMarket market = f.market;
    market.lease_term = 36;
    market.km = 18000;
    for (auto _ : state) {
        auto quote = quote_deal(f.program, f.inputs, &market);
        benchmark::DoNotOptimize(quote);
    }
    state.SetLabel("financing + matcher + lease + grid");
}
BENCHMARK(BM_QuoteDeal);

BENCHMARK_MAIN();
