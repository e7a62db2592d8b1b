#include "fec_scanner/schema_registry.hpp"

#include <initializer_list>

// Shipped column layouts. Comma-era layouts (versions 1 through 5) are
// registered at 1.0, the split-name layouts at 6.1, and the schedules whose
// layout changed again at 8.0. Later versions resolve to the nearest prior
// registration. Schedules take line-numbered codes (SA11AI), forms take
// the N/A/T amendment suffix (F3XN).

namespace fec {

namespace {

using K = ColumnKind;

ColumnSpec col(const char* name, K kind = K::Text, bool required = false) {
  ColumnSpec c;
  c.name = name;
  c.kind = kind;
  c.required = required;
  return c;
}

ColumnSpec req(const char* name)  { return col(name, K::Text, true); }
ColumnSpec amt(const char* name)  { return col(name, K::Decimal); }
ColumnSpec date(const char* name) { return col(name, K::Date); }
ColumnSpec flag(const char* name) { return col(name, K::Boolean); }

ColumnSpec one_of(const char* name, std::initializer_list<const char*> values) {
  ColumnSpec c = col(name, K::Enumerated);
  for (auto v : values) c.allowed.emplace_back(v);
  return c;
}

ColumnSpec entity_type() {
  return one_of("entity_type", {"IND", "ORG", "COM", "CAN", "CCM", "PAC", "PTY"});
}

void add_header(SchemaRegistry& r) {
  r.add({1, 0}, "HDR", {
    req("record_type"), col("ef_type"), req("fec_version"), col("soft_name"), col("soft_ver"),
    col("name_delim"), col("report_id"), col("report_number"), col("comment"),
  });
  r.add({6, 1}, "HDR", {
    req("record_type"), col("ef_type"), req("fec_version"), col("soft_name"), col("soft_ver"),
    col("report_id"), col("report_number"), col("comment"),
  });
}

void add_f3(SchemaRegistry& r) {
  r.add({1, 0}, "F3", {
    req("form_type"), req("filer_committee_id_number"), col("committee_name"), flag("change_of_address"),
    col("street_1"), col("street_2"), col("city"), col("state"), col("zip_code"),
    col("election_state"), col("election_district"), col("report_code"), col("election_code"),
    date("date_of_election"), col("state_of_election"),
    flag("primary_election"), flag("general_election"), flag("special_election"), flag("runoff_election"),
    date("coverage_from_date"), date("coverage_through_date"),
    amt("col_a_total_contributions_no_loans"), amt("col_a_total_contributions_refunds"),
    amt("col_a_net_contributions"), amt("col_a_total_operating_expenditures"),
    amt("col_a_total_offset_to_operating_expenditures"), amt("col_a_net_operating_expenditures"),
    amt("col_a_cash_on_hand_close_of_period"),
  });
  r.add({6, 1}, "F3", {
    req("form_type"), req("filer_committee_id_number"), col("committee_name"), flag("change_of_address"),
    col("street_1"), col("street_2"), col("city"), col("state"), col("zip_code"),
    col("election_state"), col("election_district"), col("report_code"), col("election_code"),
    date("date_of_election"), col("state_of_election"),
    date("coverage_from_date"), date("coverage_through_date"),
    col("treasurer_last_name"), col("treasurer_first_name"), col("treasurer_middle_name"),
    col("treasurer_prefix"), col("treasurer_suffix"), date("date_signed"),
    col("candidate_id_number"), col("candidate_last_name"), col("candidate_first_name"),
    col("candidate_middle_name"), col("candidate_prefix"), col("candidate_suffix"),
    col("report_type"),
    amt("col_a_total_contributions_no_loans"), amt("col_a_total_contributions_refunds"),
    amt("col_a_net_contributions"), amt("col_a_total_operating_expenditures"),
    amt("col_a_total_offset_to_operating_expenditures"), amt("col_a_net_operating_expenditures"),
    amt("col_a_cash_on_hand_close_of_period"),
  });
}

void add_f3x(SchemaRegistry& r) {
  r.add({1, 0}, "F3X", {
    req("form_type"), req("filer_committee_id_number"), col("committee_name"), flag("change_of_address"),
    col("street_1"), col("street_2"), col("city"), col("state"), col("zip_code"),
    flag("qualified_committee"), col("report_code"), col("election_code"),
    date("date_of_election"), col("state_of_election"),
    date("coverage_from_date"), date("coverage_through_date"),
    col("treasurer_name"), date("date_signed"),
    amt("col_a_cash_on_hand_beginning_period"), amt("col_a_total_receipts"), amt("col_a_subtotal"),
    amt("col_a_total_disbursements"), amt("col_a_cash_on_hand_close_of_period"),
  });
  r.add({6, 1}, "F3X", {
    req("form_type"), req("filer_committee_id_number"), col("committee_name"), flag("change_of_address"),
    col("street_1"), col("street_2"), col("city"), col("state"), col("zip_code"),
    col("report_code"), col("election_code"), date("date_of_election"), col("state_of_election"),
    date("coverage_from_date"), date("coverage_through_date"), flag("qualified_committee"),
    col("treasurer_last_name"), col("treasurer_first_name"), col("treasurer_middle_name"),
    col("treasurer_prefix"), col("treasurer_suffix"), date("date_signed"),
    amt("col_a_cash_on_hand_beginning_period"), amt("col_a_total_receipts"), amt("col_a_subtotal"),
    amt("col_a_total_disbursements"), amt("col_a_cash_on_hand_close_of_period"),
    amt("col_b_cash_on_hand_jan_1"), col("col_b_year"), amt("col_b_total_receipts"),
    amt("col_b_subtotal"), amt("col_b_total_disbursements"), amt("col_b_cash_on_hand_close_of_period"),
  });
}

void add_f99(SchemaRegistry& r) {
  // `text` is filled from the [BEGINTEXT]..[ENDTEXT] block following the record.
  r.add({1, 0}, "F99", {
    req("form_type"), req("filer_committee_id_number"), col("committee_name"),
    col("street_1"), col("street_2"), col("city"), col("state"), col("zip_code"),
    col("treasurer_name"), date("date_signed"), col("text_code"), col("text"),
  });
  r.add({6, 1}, "F99", {
    req("form_type"), req("filer_committee_id_number"), col("committee_name"),
    col("street_1"), col("street_2"), col("city"), col("state"), col("zip_code"),
    col("treasurer_last_name"), col("treasurer_first_name"), col("treasurer_middle_name"),
    col("treasurer_prefix"), col("treasurer_suffix"), date("date_signed"), col("text_code"),
    col("text"),
  });
}

void add_sa(SchemaRegistry& r) {
  r.add({1, 0}, "SA", {
    req("form_type"), req("filer_committee_id_number"), entity_type(), col("contributor_name"),
    col("contributor_street_1"), col("contributor_street_2"), col("contributor_city"),
    col("contributor_state"), col("contributor_zip_code"),
    col("election_code"), col("election_other_description"),
    col("contributor_employer"), col("contributor_occupation"),
    amt("contribution_aggregate"), date("contribution_date"), amt("contribution_amount"),
    col("contribution_purpose_code"), col("contribution_purpose_descrip"),
    col("donor_committee_fec_id"), col("donor_candidate_fec_id"), col("donor_candidate_name"),
    col("donor_candidate_office"), col("donor_candidate_state"), col("donor_candidate_district"),
    col("conduit_name"), col("conduit_street1"), col("conduit_street2"), col("conduit_city"),
    col("conduit_state"), col("conduit_zip_code"),
    flag("memo_code"), col("memo_text_description"), col("amended_cd"),
    col("transaction_id"), col("back_reference_tran_id_number"), col("back_reference_sched_name"),
    col("reference_code"),
  }, CodeRule::LineNumber);
  r.add({6, 1}, "SA", {
    req("form_type"), req("filer_committee_id_number"), req("transaction_id"),
    col("back_reference_tran_id_number"), col("back_reference_sched_name"), entity_type(),
    col("contributor_organization_name"), col("contributor_last_name"), col("contributor_first_name"),
    col("contributor_middle_name"), col("contributor_prefix"), col("contributor_suffix"),
    col("contributor_street_1"), col("contributor_street_2"), col("contributor_city"),
    col("contributor_state"), col("contributor_zip_code"),
    col("election_code"), col("election_other_description"),
    date("contribution_date"), amt("contribution_amount"), amt("contribution_aggregate"),
    col("contribution_purpose_code"), col("contribution_purpose_descrip"),
    col("contributor_employer"), col("contributor_occupation"),
    col("donor_committee_fec_id"), col("donor_committee_name"), col("donor_candidate_fec_id"),
    col("donor_candidate_last_name"), col("donor_candidate_first_name"),
    col("donor_candidate_middle_name"), col("donor_candidate_prefix"), col("donor_candidate_suffix"),
    col("donor_candidate_office"), col("donor_candidate_state"), col("donor_candidate_district"),
    col("conduit_name"), col("conduit_street1"), col("conduit_street2"), col("conduit_city"),
    col("conduit_state"), col("conduit_zip_code"),
    flag("memo_code"), col("memo_text_description"), col("reference_code"),
  }, CodeRule::LineNumber);
  // 8.0 drops the purpose code.
  r.add({8, 0}, "SA", {
    req("form_type"), req("filer_committee_id_number"), req("transaction_id"),
    col("back_reference_tran_id_number"), col("back_reference_sched_name"), entity_type(),
    col("contributor_organization_name"), col("contributor_last_name"), col("contributor_first_name"),
    col("contributor_middle_name"), col("contributor_prefix"), col("contributor_suffix"),
    col("contributor_street_1"), col("contributor_street_2"), col("contributor_city"),
    col("contributor_state"), col("contributor_zip_code"),
    col("election_code"), col("election_other_description"),
    date("contribution_date"), amt("contribution_amount"), amt("contribution_aggregate"),
    col("contribution_purpose_descrip"), col("contributor_employer"), col("contributor_occupation"),
    col("donor_committee_fec_id"), col("donor_committee_name"), col("donor_candidate_fec_id"),
    col("donor_candidate_last_name"), col("donor_candidate_first_name"),
    col("donor_candidate_middle_name"), col("donor_candidate_prefix"), col("donor_candidate_suffix"),
    col("donor_candidate_office"), col("donor_candidate_state"), col("donor_candidate_district"),
    col("conduit_name"), col("conduit_street1"), col("conduit_street2"), col("conduit_city"),
    col("conduit_state"), col("conduit_zip_code"),
    flag("memo_code"), col("memo_text_description"), col("reference_code"),
  }, CodeRule::LineNumber);
}

void add_sb(SchemaRegistry& r) {
  r.add({1, 0}, "SB", {
    req("form_type"), req("filer_committee_id_number"), entity_type(), col("payee_name"),
    col("payee_street_1"), col("payee_street_2"), col("payee_city"), col("payee_state"),
    col("payee_zip_code"), col("expenditure_purpose_code"), col("expenditure_purpose_descrip"),
    col("election_code"), col("election_other_description"),
    date("expenditure_date"), amt("expenditure_amount"),
    col("beneficiary_committee_fec_id"), col("beneficiary_candidate_fec_id"),
    col("beneficiary_candidate_name"), col("beneficiary_candidate_office"),
    col("beneficiary_candidate_state"), col("beneficiary_candidate_district"),
    col("conduit_name"), col("conduit_street_1"), col("conduit_street_2"), col("conduit_city"),
    col("conduit_state"), col("conduit_zip_code"), col("amended_cd"),
    flag("memo_code"), col("memo_text_description"),
    col("transaction_id_number"), col("back_reference_tran_id_number"), col("back_reference_sched_name"),
    col("reference_code"),
  }, CodeRule::LineNumber);
  r.add({6, 1}, "SB", {
    req("form_type"), req("filer_committee_id_number"), req("transaction_id_number"),
    col("back_reference_tran_id_number"), col("back_reference_sched_name"), entity_type(),
    col("payee_organization_name"), col("payee_last_name"), col("payee_first_name"),
    col("payee_middle_name"), col("payee_prefix"), col("payee_suffix"),
    col("payee_street_1"), col("payee_street_2"), col("payee_city"), col("payee_state"),
    col("payee_zip_code"), col("election_code"), col("election_other_description"),
    date("expenditure_date"), amt("expenditure_amount"), amt("semi_annual_refunded_bundled_amt"),
    col("expenditure_purpose_code"), col("expenditure_purpose_descrip"), col("category_code"),
    col("beneficiary_committee_fec_id"), col("beneficiary_committee_name"),
    col("beneficiary_candidate_fec_id"), col("beneficiary_candidate_last_name"),
    col("beneficiary_candidate_first_name"), col("beneficiary_candidate_middle_name"),
    col("beneficiary_candidate_prefix"), col("beneficiary_candidate_suffix"),
    col("beneficiary_candidate_office"), col("beneficiary_candidate_state"),
    col("beneficiary_candidate_district"),
    col("conduit_name"), col("conduit_street_1"), col("conduit_street_2"), col("conduit_city"),
    col("conduit_state"), col("conduit_zip_code"),
    flag("memo_code"), col("memo_text_description"),
    col("reference_to_si_or_sl_system_code_that_identifies_the_account"),
  }, CodeRule::LineNumber);
  r.add({8, 0}, "SB", {
    req("form_type"), req("filer_committee_id_number"), req("transaction_id_number"),
    col("back_reference_tran_id_number"), col("back_reference_sched_name"), entity_type(),
    col("payee_organization_name"), col("payee_last_name"), col("payee_first_name"),
    col("payee_middle_name"), col("payee_prefix"), col("payee_suffix"),
    col("payee_street_1"), col("payee_street_2"), col("payee_city"), col("payee_state"),
    col("payee_zip_code"), col("election_code"), col("election_other_description"),
    date("expenditure_date"), amt("expenditure_amount"), amt("semi_annual_refunded_bundled_amt"),
    col("expenditure_purpose_descrip"), col("category_code"),
    col("beneficiary_committee_fec_id"), col("beneficiary_committee_name"),
    col("beneficiary_candidate_fec_id"), col("beneficiary_candidate_last_name"),
    col("beneficiary_candidate_first_name"), col("beneficiary_candidate_middle_name"),
    col("beneficiary_candidate_prefix"), col("beneficiary_candidate_suffix"),
    col("beneficiary_candidate_office"), col("beneficiary_candidate_state"),
    col("beneficiary_candidate_district"),
    col("conduit_name"), col("conduit_street_1"), col("conduit_street_2"), col("conduit_city"),
    col("conduit_state"), col("conduit_zip_code"),
    flag("memo_code"), col("memo_text_description"),
    col("reference_to_si_or_sl_system_code_that_identifies_the_account"),
  }, CodeRule::LineNumber);
}

void add_text(SchemaRegistry& r) {
  r.add({1, 0}, "TEXT", {
    req("rec_type"), req("filer_committee_id_number"), col("transaction_id_number"),
    col("back_reference_tran_id_number"), col("back_reference_sched_form_name"), col("text4000"),
  });
}

}

void register_builtin_schemas(SchemaRegistry& registry) {
  add_header(registry);
  add_f3(registry);
  add_f3x(registry);
  add_f99(registry);
  add_sa(registry);
  add_sb(registry);
  add_text(registry);
}

}
