/**
 * @file example_deal_quote.cc
 * @brief Quote a deal from form text: financing comparison, lease and lease grid
 */

#include "src/deal/deal_quote.hpp"
#include "src/finance/amortization.hpp"
#include "src/finance/deal_inputs.hpp"
#include <iomanip>
#include <iostream>

using namespace dealcalc;

namespace {

VehicleProgram make_program() {
    VehicleProgram program;
    program.brand = "Ram";
    program.model = "1500";
    program.trim = "Sport, Rebel";
    program.year = 2025;
    program.consumer_cash = 3000.0;
    program.bonus_cash = 1000.0;
    program.option1_rates = RateTable::create({{36, 4.99}, {48, 5.49}, {60, 5.99}, {72, 6.49}}).value();
    program.option2_rates = RateTable::create({{36, 0.0}, {48, 0.99}, {60, 1.99}, {72, 2.99}}).value();
    return program;
}

LeaseMarket make_market() {
    LeaseMarket market;

    ResidualEntry residual;
    residual.brand = "Ram";
    residual.model_name = "1500";
    residual.trim = "Rebel";
    residual.body_style = "Crew Cab";
    residual.residual_percentages = {
        {24, 64.0}, {27, 62.0}, {36, 56.0}, {39, 54.0}, {42, 52.0},
        {48, 47.0}, {51, 45.0}, {54, 43.0}, {60, 0.0}};
    market.residuals.push_back(residual);

    market.km_adjustments.adjustments[MileageTier::Km12000] = {{24, 3.0}, {36, 3.0}, {48, 4.0}};
    market.km_adjustments.adjustments[MileageTier::Km18000] = {{24, 1.0}, {36, 1.0}, {48, 2.0}};

    LeaseRateEntry rates;
    rates.brand = "Ram";
    rates.model = "Ram 1500 Sport, Rebel";
    rates.standard_rates = {{24, 6.99}, {36, 6.49}, {39, 6.49}, {48, 6.99}};
    rates.alternative_rates = {{36, 2.99}, {48, 3.99}};
    rates.lease_cash = 2500.0;
    market.lease_rates.by_year[2025] = {rates};

    market.lease_term = 36;
    market.km = 18000;
    market.body_style = "Crew Cab";
    return market;
}

void print_payment(const char* label, double amount) {
    std::cout << "   " << std::left << std::setw(28) << label
              << std::right << std::setw(12) << round_cents(amount) << "\n";
}

}  // namespace

int main() {
    std::cout << std::fixed << std::setprecision(2);

    RawDealInputs raw;
    raw.vehicle_price = "64995";
    raw.accessories = {{"Tonneau cover", "1295"}};
    raw.admin_fee = "799";
    raw.tire_tax = "15";
    raw.rdprm_fee = "101.50";
    raw.trade_in_value = "18000";
    raw.trade_in_owed = "9500";
    raw.down_payment = "2500";
    raw.term = 72;
    raw.frequency = "biweekly";

    auto inputs = parse_deal_inputs(raw);
    if (!inputs) {
        std::cerr << "Invalid deal: " << inputs.error() << "\n";
        return 1;
    }

    const auto program = make_program();
    const auto market = make_market();

    auto quote = quote_deal(program, *inputs, &market);
    if (!quote) {
        std::cerr << "Quote failed: " << quote.error() << "\n";
        return 1;
    }

    const auto& financing = quote->financing;
    std::cout << "=== Financing, " << financing.term << " months ===\n";
    print_payment("Option 1 monthly", financing.option1.payment.monthly);
    if (financing.option2) {
        print_payment("Option 2 monthly", financing.option2->payment.monthly);
        std::cout << "   Best: option " << (financing.best_option == FinancingChoice::Option2 ? 2 : 1)
                  << ", saves " << round_cents(financing.savings.value_or(0.0)) << "\n";
    }
    print_payment("Biweekly (recommended)", quote->financing_payment);

    if (!quote->lease) {
        std::cout << "\nNo lease offered for this vehicle\n";
        return 0;
    }

    const auto& lease = *quote->lease;
    if (lease.selected) {
        std::cout << "\n=== Lease, " << lease.selected->term << " months, "
                  << km_per_year(lease.selected->mileage) << " km/yr ===\n";
        std::cout << "   Residual " << lease.selected->residual_pct << "% = "
                  << round_cents(lease.selected->residual_value) << "\n";
        for (const auto* s : {lease.selected->standard ? &*lease.selected->standard : nullptr,
                              lease.selected->alternative ? &*lease.selected->alternative : nullptr}) {
            if (!s) {
                continue;
            }
            std::cout << "   [" << to_string(s->plan) << "] rate " << s->rate_pct << "%\n";
            print_payment("  pre-tax monthly", s->pre_tax_payment.monthly);
            print_payment("  post-tax monthly", s->post_tax_payment.monthly);
            print_payment("  total cost", s->total_cost);
            if (s->has_lost_trade_credit()) {
                print_payment("  trade-in credit lost", s->trade_credit_lost);
            }
        }
    }

    std::cout << "\n=== Lease grid (" << lease.grid.grid.size() << " combinations) ===\n";
    if (lease.grid.best) {
        const auto& best = *lease.grid.best;
        std::cout << "   Lowest payment: " << best.term << " months, "
                  << km_per_year(best.mileage) << " km/yr, " << to_string(best.plan) << "\n";
        print_payment("  post-tax monthly", best.monthly_payment);
    }
    return 0;
}
