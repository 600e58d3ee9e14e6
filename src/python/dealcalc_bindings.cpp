// SPDX-License-Identifier: MIT
/**
 * @file dealcalc_bindings.cpp
 * @brief Python bindings for the dealcalc engine using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <map>
#include <sstream>
#include <utility>
#include <vector>
#include "src/deal/deal_quote.hpp"
#include "src/deal/net_cost.hpp"
#include "src/finance/amortization.hpp"
#include "src/finance/deal_config.hpp"
#include "src/finance/deal_inputs.hpp"
#include "src/finance/financing.hpp"
#include "src/finance/rate_table.hpp"
#include "src/finance/vehicle_program.hpp"
#include "src/lease/lease_engine.hpp"
#include "src/lease/lease_grid.hpp"
#include "src/lease/lease_tables.hpp"
#include "src/support/error_types.hpp"
#include "src/support/text_parse.hpp"

namespace py = pybind11;

namespace {

std::string format_error(const dealcalc::ValidationError& err) {
    std::ostringstream os;
    os << err;
    return os.str();
}

// Unwrap an engine result or raise ValueError
template <typename T>
T unwrap(std::expected<T, dealcalc::ValidationError> result) {
    if (!result) {
        throw py::value_error(format_error(result.error()));
    }
    return std::move(result.value());
}

dealcalc::RateTable rate_table_from_python(const std::vector<std::pair<int, double>>& entries) {
    return unwrap(dealcalc::RateTable::create(entries));
}

}  // namespace

PYBIND11_MODULE(dealcalc_py, m) {
    m.doc() = "Python bindings for the dealcalc automotive financing and lease engine";

    py::enum_<dealcalc::ValidationErrorCode>(m, "ValidationErrorCode")
        .value("INVALID_TERM", dealcalc::ValidationErrorCode::InvalidTerm)
        .value("UNSUPPORTED_TERM", dealcalc::ValidationErrorCode::UnsupportedTerm)
        .value("INVALID_MILEAGE", dealcalc::ValidationErrorCode::InvalidMileage)
        .value("INVALID_FREQUENCY", dealcalc::ValidationErrorCode::InvalidFrequency)
        .value("INVALID_AMOUNT", dealcalc::ValidationErrorCode::InvalidAmount)
        .value("INVALID_RATE", dealcalc::ValidationErrorCode::InvalidRate)
        .value("INVALID_TAX_RATE", dealcalc::ValidationErrorCode::InvalidTaxRate);

    py::enum_<dealcalc::PaymentFrequency>(m, "PaymentFrequency")
        .value("MONTHLY", dealcalc::PaymentFrequency::Monthly)
        .value("BIWEEKLY", dealcalc::PaymentFrequency::Biweekly)
        .value("WEEKLY", dealcalc::PaymentFrequency::Weekly);

    py::enum_<dealcalc::FinancingChoice>(m, "FinancingChoice")
        .value("OPTION1", dealcalc::FinancingChoice::Option1)
        .value("OPTION2", dealcalc::FinancingChoice::Option2);

    py::enum_<dealcalc::LeasePlan>(m, "LeasePlan")
        .value("STANDARD", dealcalc::LeasePlan::Standard)
        .value("ALTERNATIVE", dealcalc::LeasePlan::Alternative);

    py::enum_<dealcalc::MileageTier>(m, "MileageTier")
        .value("KM_12000", dealcalc::MileageTier::Km12000)
        .value("KM_18000", dealcalc::MileageTier::Km18000)
        .value("KM_24000", dealcalc::MileageTier::Km24000);

    // Configuration
    py::class_<dealcalc::SalesTaxRates>(m, "SalesTaxRates")
        .def(py::init<>())
        .def_readwrite("gst", &dealcalc::SalesTaxRates::gst)
        .def_readwrite("qst", &dealcalc::SalesTaxRates::qst)
        .def("combined", &dealcalc::SalesTaxRates::combined);

    py::class_<dealcalc::DealConfig>(m, "DealConfig")
        .def(py::init<>())
        .def_readwrite("taxes", &dealcalc::DealConfig::taxes)
        .def_readwrite("fallback_rate_pct", &dealcalc::DealConfig::fallback_rate_pct);

    py::class_<dealcalc::TaxBreakdown>(m, "TaxBreakdown")
        .def(py::init<>())
        .def_readonly("gst", &dealcalc::TaxBreakdown::gst)
        .def_readonly("qst", &dealcalc::TaxBreakdown::qst)
        .def_readonly("total", &dealcalc::TaxBreakdown::total);

    py::class_<dealcalc::PeriodicPayment>(m, "PeriodicPayment")
        .def(py::init<>())
        .def_readonly("monthly", &dealcalc::PeriodicPayment::monthly)
        .def_readonly("biweekly", &dealcalc::PeriodicPayment::biweekly)
        .def_readonly("weekly", &dealcalc::PeriodicPayment::weekly)
        .def("for_frequency", &dealcalc::PeriodicPayment::for_frequency, py::arg("frequency"))
        .def("__repr__", [](const dealcalc::PeriodicPayment& p) {
            return "<PeriodicPayment monthly=" + std::to_string(p.monthly) +
                   " biweekly=" + std::to_string(p.biweekly) +
                   " weekly=" + std::to_string(p.weekly) + ">";
        });

    // Deal inputs
    py::class_<dealcalc::Accessory>(m, "Accessory")
        .def(py::init<>())
        .def(py::init([](std::string description, double price) {
            return dealcalc::Accessory{std::move(description), price};
        }), py::arg("description"), py::arg("price"))
        .def_readwrite("description", &dealcalc::Accessory::description)
        .def_readwrite("price", &dealcalc::Accessory::price);

    py::class_<dealcalc::DealInputs>(m, "DealInputs")
        .def(py::init<>())
        .def_readwrite("vehicle_price", &dealcalc::DealInputs::vehicle_price)
        .def_readwrite("accessories", &dealcalc::DealInputs::accessories)
        .def_readwrite("admin_fee", &dealcalc::DealInputs::admin_fee)
        .def_readwrite("tire_tax", &dealcalc::DealInputs::tire_tax)
        .def_readwrite("rdprm_fee", &dealcalc::DealInputs::rdprm_fee)
        .def_readwrite("trade_in_value", &dealcalc::DealInputs::trade_in_value)
        .def_readwrite("trade_in_owed", &dealcalc::DealInputs::trade_in_owed)
        .def_readwrite("down_payment", &dealcalc::DealInputs::down_payment)
        .def_readwrite("bonus_cash_override", &dealcalc::DealInputs::bonus_cash_override)
        .def_readwrite("term", &dealcalc::DealInputs::term)
        .def_readwrite("frequency", &dealcalc::DealInputs::frequency)
        .def_readwrite("pdsf", &dealcalc::DealInputs::pdsf)
        .def_readwrite("dealer_discount", &dealcalc::DealInputs::dealer_discount)
        .def_readwrite("carried_balance", &dealcalc::DealInputs::carried_balance);

    py::class_<dealcalc::RawAccessory>(m, "RawAccessory")
        .def(py::init<>())
        .def_readwrite("description", &dealcalc::RawAccessory::description)
        .def_readwrite("price", &dealcalc::RawAccessory::price);

    py::class_<dealcalc::RawDealInputs>(m, "RawDealInputs")
        .def(py::init<>())
        .def_readwrite("vehicle_price", &dealcalc::RawDealInputs::vehicle_price)
        .def_readwrite("accessories", &dealcalc::RawDealInputs::accessories)
        .def_readwrite("admin_fee", &dealcalc::RawDealInputs::admin_fee)
        .def_readwrite("tire_tax", &dealcalc::RawDealInputs::tire_tax)
        .def_readwrite("rdprm_fee", &dealcalc::RawDealInputs::rdprm_fee)
        .def_readwrite("trade_in_value", &dealcalc::RawDealInputs::trade_in_value)
        .def_readwrite("trade_in_owed", &dealcalc::RawDealInputs::trade_in_owed)
        .def_readwrite("down_payment", &dealcalc::RawDealInputs::down_payment)
        .def_readwrite("bonus_cash_override", &dealcalc::RawDealInputs::bonus_cash_override)
        .def_readwrite("term", &dealcalc::RawDealInputs::term)
        .def_readwrite("frequency", &dealcalc::RawDealInputs::frequency)
        .def_readwrite("pdsf", &dealcalc::RawDealInputs::pdsf)
        .def_readwrite("dealer_discount", &dealcalc::RawDealInputs::dealer_discount)
        .def_readwrite("carried_balance", &dealcalc::RawDealInputs::carried_balance);

    m.def("parse_or_zero", [](const std::string& text) {
        return dealcalc::parse_or_zero(text);
    }, py::arg("text"), "Parse a number from form text; anything unparsable is 0");

    m.def("parse_deal_inputs", [](const dealcalc::RawDealInputs& raw) {
        return unwrap(dealcalc::parse_deal_inputs(raw));
    }, py::arg("raw"),
        R"pbdoc(
            Parse form text into DealInputs.

            Raises:
                ValueError: On a non-positive term or unknown frequency
        )pbdoc");

    // Programs
    py::class_<dealcalc::RateTable>(m, "RateTable")
        .def(py::init<>())
        .def(py::init(&rate_table_from_python), py::arg("entries"),
            "Build from a list of (term, rate_pct) pairs")
        .def("find", &dealcalc::RateTable::find, py::arg("term"))
        .def("empty", &dealcalc::RateTable::empty);

    py::class_<dealcalc::VehicleProgram>(m, "VehicleProgram")
        .def(py::init<>())
        .def_readwrite("brand", &dealcalc::VehicleProgram::brand)
        .def_readwrite("model", &dealcalc::VehicleProgram::model)
        .def_readwrite("trim", &dealcalc::VehicleProgram::trim)
        .def_readwrite("year", &dealcalc::VehicleProgram::year)
        .def_readwrite("consumer_cash", &dealcalc::VehicleProgram::consumer_cash)
        .def_readwrite("bonus_cash", &dealcalc::VehicleProgram::bonus_cash)
        .def_readwrite("option1_rates", &dealcalc::VehicleProgram::option1_rates)
        .def_readwrite("option2_rates", &dealcalc::VehicleProgram::option2_rates)
        .def("has_option2", &dealcalc::VehicleProgram::has_option2);

    // Financing
    py::class_<dealcalc::FinancingPrincipal>(m, "FinancingPrincipal")
        .def_readonly("taxable_fees", &dealcalc::FinancingPrincipal::taxable_fees)
        .def_readonly("taxable_base", &dealcalc::FinancingPrincipal::taxable_base)
        .def_readonly("tax", &dealcalc::FinancingPrincipal::tax)
        .def_readonly("gross_principal", &dealcalc::FinancingPrincipal::gross_principal)
        .def_readonly("net_principal", &dealcalc::FinancingPrincipal::net_principal)
        .def("financed", &dealcalc::FinancingPrincipal::financed);

    py::class_<dealcalc::FinancingOption>(m, "FinancingOption")
        .def_readonly("rate_pct", &dealcalc::FinancingOption::rate_pct)
        .def_readonly("principal", &dealcalc::FinancingOption::principal)
        .def_readonly("payment", &dealcalc::FinancingOption::payment)
        .def_readonly("total", &dealcalc::FinancingOption::total);

    py::class_<dealcalc::FinancingResult>(m, "FinancingResult")
        .def_readonly("term", &dealcalc::FinancingResult::term)
        .def_readonly("option1", &dealcalc::FinancingResult::option1)
        .def_readonly("option2", &dealcalc::FinancingResult::option2)
        .def_readonly("best_option", &dealcalc::FinancingResult::best_option)
        .def_readonly("savings", &dealcalc::FinancingResult::savings)
        .def_readonly("bonus_cash_applied", &dealcalc::FinancingResult::bonus_cash_applied)
        .def_readonly("trade_equity", &dealcalc::FinancingResult::trade_equity)
        .def("recommended", &dealcalc::FinancingResult::recommended,
             py::return_value_policy::reference_internal);

    py::class_<dealcalc::AmortizationRow>(m, "AmortizationRow")
        .def_readonly("period", &dealcalc::AmortizationRow::period)
        .def_readonly("payment", &dealcalc::AmortizationRow::payment)
        .def_readonly("interest", &dealcalc::AmortizationRow::interest)
        .def_readonly("principal", &dealcalc::AmortizationRow::principal)
        .def_readonly("balance", &dealcalc::AmortizationRow::balance);

    m.def("monthly_payment", &dealcalc::monthly_payment,
          py::arg("principal"), py::arg("annual_rate_pct"), py::arg("n_months"));
    m.def("amortization_schedule", &dealcalc::amortization_schedule,
          py::arg("principal"), py::arg("annual_rate_pct"), py::arg("n_months"));

    m.def("compute_financing",
        [](const dealcalc::VehicleProgram& program, const dealcalc::DealInputs& inputs,
           int term, const dealcalc::DealConfig& config) {
            return unwrap(dealcalc::compute_financing(program, inputs, term, config));
        },
        py::arg("program"), py::arg("inputs"), py::arg("term"),
        py::arg("config") = dealcalc::DealConfig{},
        R"pbdoc(
            Compare the program's financing options for one term.

            Raises:
                ValueError: On an unsupported term or non-finite amount
        )pbdoc");

    m.def("compare_financing_terms",
        [](const dealcalc::VehicleProgram& program, const dealcalc::DealInputs& inputs,
           const dealcalc::DealConfig& config) {
            return unwrap(dealcalc::compare_financing_terms(program, inputs, config));
        },
        py::arg("program"), py::arg("inputs"), py::arg("config") = dealcalc::DealConfig{});

    // Lease tables
    py::class_<dealcalc::ResidualEntry>(m, "ResidualEntry")
        .def(py::init<>())
        .def_readwrite("brand", &dealcalc::ResidualEntry::brand)
        .def_readwrite("model_name", &dealcalc::ResidualEntry::model_name)
        .def_readwrite("trim", &dealcalc::ResidualEntry::trim)
        .def_readwrite("body_style", &dealcalc::ResidualEntry::body_style)
        .def_property("residual_percentages",
            [](const dealcalc::ResidualEntry& self) { return self.residual_percentages; },
            [](dealcalc::ResidualEntry& self, const std::map<int, double>& value) {
                self.residual_percentages = value;
            },
            "Copy of the mapping; assign a whole dict to change it")
        .def("label", &dealcalc::ResidualEntry::label)
        .def("residual_pct", &dealcalc::ResidualEntry::residual_pct, py::arg("term"));

    py::class_<dealcalc::KmAdjustmentTable>(m, "KmAdjustmentTable")
        .def(py::init<>())
        .def_property("adjustments",
            [](const dealcalc::KmAdjustmentTable& self) { return self.adjustments; },
            [](dealcalc::KmAdjustmentTable& self,
               const std::map<dealcalc::MileageTier, std::map<int, double>>& value) {
                self.adjustments = value;
            },
            "Copy of the mapping; assign a whole dict to change it")
        .def("points", &dealcalc::KmAdjustmentTable::points, py::arg("tier"), py::arg("term"));

    py::class_<dealcalc::LeaseRateEntry>(m, "LeaseRateEntry")
        .def(py::init<>())
        .def_readwrite("brand", &dealcalc::LeaseRateEntry::brand)
        .def_readwrite("model", &dealcalc::LeaseRateEntry::model)
        .def_property("standard_rates",
            [](const dealcalc::LeaseRateEntry& self) { return self.standard_rates; },
            [](dealcalc::LeaseRateEntry& self, const std::map<int, double>& value) {
                self.standard_rates = value;
            },
            "Copy of the mapping; assign a whole dict to change it")
        .def_property("alternative_rates",
            [](const dealcalc::LeaseRateEntry& self) { return self.alternative_rates; },
            [](dealcalc::LeaseRateEntry& self, const std::map<int, double>& value) {
                self.alternative_rates = value;
            },
            "Copy of the mapping; assign a whole dict to change it")
        .def_readwrite("lease_cash", &dealcalc::LeaseRateEntry::lease_cash);

    py::class_<dealcalc::LeaseRateCatalog>(m, "LeaseRateCatalog")
        .def(py::init<>())
        .def_property("by_year",
            [](const dealcalc::LeaseRateCatalog& self) { return self.by_year; },
            [](dealcalc::LeaseRateCatalog& self,
               const std::map<int, std::vector<dealcalc::LeaseRateEntry>>& value) {
                self.by_year = value;
            },
            "Copy of the mapping; assign a whole dict to change it");

    // Lease results
    py::class_<dealcalc::LeaseScenarioResult>(m, "LeaseScenarioResult")
        .def_readonly("plan", &dealcalc::LeaseScenarioResult::plan)
        .def_readonly("term", &dealcalc::LeaseScenarioResult::term)
        .def_readonly("mileage", &dealcalc::LeaseScenarioResult::mileage)
        .def_readonly("rate_pct", &dealcalc::LeaseScenarioResult::rate_pct)
        .def_readonly("lease_cash", &dealcalc::LeaseScenarioResult::lease_cash)
        .def_readonly("pdsf", &dealcalc::LeaseScenarioResult::pdsf)
        .def_readonly("residual_pct", &dealcalc::LeaseScenarioResult::residual_pct)
        .def_readonly("residual_value", &dealcalc::LeaseScenarioResult::residual_value)
        .def_readonly("selling_price", &dealcalc::LeaseScenarioResult::selling_price)
        .def_readonly("cap_cost", &dealcalc::LeaseScenarioResult::cap_cost)
        .def_readonly("carried_balance_net", &dealcalc::LeaseScenarioResult::carried_balance_net)
        .def_readonly("net_cap_cost", &dealcalc::LeaseScenarioResult::net_cap_cost)
        .def_readonly("money_factor", &dealcalc::LeaseScenarioResult::money_factor)
        .def_readonly("depreciation", &dealcalc::LeaseScenarioResult::depreciation)
        .def_readonly("finance_charge", &dealcalc::LeaseScenarioResult::finance_charge)
        .def_readonly("payment_tax", &dealcalc::LeaseScenarioResult::payment_tax)
        .def_readonly("trade_credit_potential", &dealcalc::LeaseScenarioResult::trade_credit_potential)
        .def_readonly("trade_credit_applied", &dealcalc::LeaseScenarioResult::trade_credit_applied)
        .def_readonly("trade_credit_lost", &dealcalc::LeaseScenarioResult::trade_credit_lost)
        .def_readonly("pre_tax_payment", &dealcalc::LeaseScenarioResult::pre_tax_payment)
        .def_readonly("post_tax_payment", &dealcalc::LeaseScenarioResult::post_tax_payment)
        .def_readonly("total_cost", &dealcalc::LeaseScenarioResult::total_cost)
        .def_readonly("cost_of_borrowing", &dealcalc::LeaseScenarioResult::cost_of_borrowing)
        .def("display_net_cap_cost", &dealcalc::LeaseScenarioResult::display_net_cap_cost)
        .def("has_lost_trade_credit", &dealcalc::LeaseScenarioResult::has_lost_trade_credit);

    py::class_<dealcalc::LeaseResult>(m, "LeaseResult")
        .def_readonly("vehicle_name", &dealcalc::LeaseResult::vehicle_name)
        .def_readonly("term", &dealcalc::LeaseResult::term)
        .def_readonly("mileage", &dealcalc::LeaseResult::mileage)
        .def_readonly("base_residual_pct", &dealcalc::LeaseResult::base_residual_pct)
        .def_readonly("km_adjustment", &dealcalc::LeaseResult::km_adjustment)
        .def_readonly("residual_pct", &dealcalc::LeaseResult::residual_pct)
        .def_readonly("residual_value", &dealcalc::LeaseResult::residual_value)
        .def_readonly("standard", &dealcalc::LeaseResult::standard)
        .def_readonly("alternative", &dealcalc::LeaseResult::alternative)
        .def_readonly("best_lease", &dealcalc::LeaseResult::best_lease)
        .def_readonly("savings", &dealcalc::LeaseResult::savings);

    py::class_<dealcalc::GridRow>(m, "GridRow")
        .def_readonly("term", &dealcalc::GridRow::term)
        .def_readonly("mileage", &dealcalc::GridRow::mileage)
        .def_readonly("plan", &dealcalc::GridRow::plan)
        .def_readonly("residual_pct", &dealcalc::GridRow::residual_pct)
        .def_readonly("scenario", &dealcalc::GridRow::scenario)
        .def("monthly_payment", &dealcalc::GridRow::monthly_payment);

    py::class_<dealcalc::BestLeaseOption>(m, "BestLeaseOption")
        .def_readonly("term", &dealcalc::BestLeaseOption::term)
        .def_readonly("mileage", &dealcalc::BestLeaseOption::mileage)
        .def_readonly("plan", &dealcalc::BestLeaseOption::plan)
        .def_readonly("monthly_payment", &dealcalc::BestLeaseOption::monthly_payment)
        .def_readonly("row_index", &dealcalc::BestLeaseOption::row_index)
        .def_readonly("scenario", &dealcalc::BestLeaseOption::scenario);

    py::class_<dealcalc::LeaseGridResult>(m, "LeaseGridResult")
        .def_readonly("best", &dealcalc::LeaseGridResult::best)
        .def_readonly("grid", &dealcalc::LeaseGridResult::grid);

    m.def("compute_lease",
        [](const dealcalc::ResidualEntry& residual, const dealcalc::LeaseRateEntry& rates,
           const dealcalc::KmAdjustmentTable& km_table, const dealcalc::DealInputs& inputs,
           int term, int km, double program_bonus_cash, const dealcalc::DealConfig& config) {
            return unwrap(dealcalc::compute_lease(residual, rates, km_table, inputs,
                                                  term, km, program_bonus_cash, config));
        },
        py::arg("residual"), py::arg("rates"), py::arg("km_table"), py::arg("inputs"),
        py::arg("term"), py::arg("km"), py::arg("program_bonus_cash") = 0.0,
        py::arg("config") = dealcalc::DealConfig{},
        R"pbdoc(
            Standard and alternative lease scenarios for one term and mileage.

            Returns:
                LeaseResult, or None when the term is not offered

            Raises:
                ValueError: On a non-positive term or unknown mileage
        )pbdoc");

    m.def("search_best_lease",
        [](const dealcalc::ResidualEntry& residual, const dealcalc::LeaseRateEntry& rates,
           const dealcalc::KmAdjustmentTable& km_table, const dealcalc::DealInputs& inputs,
           double program_bonus_cash, const dealcalc::DealConfig& config) {
            return unwrap(dealcalc::search_best_lease(residual, rates, km_table, inputs,
                                                      program_bonus_cash, config));
        },
        py::arg("residual"), py::arg("rates"), py::arg("km_table"), py::arg("inputs"),
        py::arg("program_bonus_cash") = 0.0, py::arg("config") = dealcalc::DealConfig{});

    // Whole deal
    py::class_<dealcalc::LeaseMarket>(m, "LeaseMarket")
        .def(py::init<>())
        .def_readwrite("residuals", &dealcalc::LeaseMarket::residuals)
        .def_readwrite("km_adjustments", &dealcalc::LeaseMarket::km_adjustments)
        .def_readwrite("lease_rates", &dealcalc::LeaseMarket::lease_rates)
        .def_readwrite("lease_term", &dealcalc::LeaseMarket::lease_term)
        .def_readwrite("km", &dealcalc::LeaseMarket::km)
        .def_readwrite("body_style", &dealcalc::LeaseMarket::body_style);

    py::class_<dealcalc::LeaseQuote>(m, "LeaseQuote")
        .def_readonly("residual_index", &dealcalc::LeaseQuote::residual_index)
        .def_readonly("lease_rate_index", &dealcalc::LeaseQuote::lease_rate_index)
        .def_readonly("selected", &dealcalc::LeaseQuote::selected)
        .def_readonly("grid", &dealcalc::LeaseQuote::grid);

    py::class_<dealcalc::DealQuote>(m, "DealQuote")
        .def_readonly("financing", &dealcalc::DealQuote::financing)
        .def_readonly("lease", &dealcalc::DealQuote::lease)
        .def_readonly("frequency", &dealcalc::DealQuote::frequency)
        .def_readonly("financing_payment", &dealcalc::DealQuote::financing_payment)
        .def_readonly("lease_payment", &dealcalc::DealQuote::lease_payment);

    m.def("quote_deal",
        [](const dealcalc::VehicleProgram& program, const dealcalc::DealInputs& inputs,
           std::optional<dealcalc::LeaseMarket> market, const dealcalc::DealConfig& config) {
            return unwrap(dealcalc::quote_deal(program, inputs,
                                               market ? &*market : nullptr, config));
        },
        py::arg("program"), py::arg("inputs"), py::arg("market") = py::none(),
        py::arg("config") = dealcalc::DealConfig{});

    // Dealer net cost
    py::class_<dealcalc::VehicleCostData>(m, "VehicleCostData")
        .def(py::init<>())
        .def_readwrite("ep_cost", &dealcalc::VehicleCostData::ep_cost)
        .def_readwrite("pdco", &dealcalc::VehicleCostData::pdco)
        .def_readwrite("pref", &dealcalc::VehicleCostData::pref)
        .def_readwrite("holdback", &dealcalc::VehicleCostData::holdback)
        .def_readwrite("invoice_total", &dealcalc::VehicleCostData::invoice_total);

    py::class_<dealcalc::NetCostResult>(m, "NetCostResult")
        .def_readonly("data", &dealcalc::NetCostResult::data)
        .def_readonly("margin", &dealcalc::NetCostResult::margin)
        .def_readonly("margin_pct", &dealcalc::NetCostResult::margin_pct)
        .def_readonly("dealer_net_cost", &dealcalc::NetCostResult::dealer_net_cost)
        .def_readonly("potential_profit", &dealcalc::NetCostResult::potential_profit);

    m.def("compute_net_cost", &dealcalc::compute_net_cost, py::arg("data"));
    m.def("validate_cost_data", [](const dealcalc::VehicleCostData& data) {
        std::vector<std::string> messages;
        for (auto issue : dealcalc::validate_cost_data(data)) {
            messages.emplace_back(dealcalc::to_string(issue));
        }
        return messages;
    }, py::arg("data"), "List of problems with the invoice figures; empty when valid");
}
