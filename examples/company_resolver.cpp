#include "company_resolver.hpp"

namespace pactum::examples {

namespace {

CompanyList resolve_impl(const std::string& /*text*/, const CompanyList& /*database*/) {
  throw ImplementThis("Company name resolution not yet implemented");
}

}  // namespace

const Contracted<CompanyList(const std::string&, const CompanyList&)>& resolve_company_names() {
  static const auto fn =
      contract<CompanyList(const std::string&, const CompanyList&)>("resolve_company_names",
                                                                    &resolve_impl)
      | with_specification("Resolves company names in text using database lookup")
      | with_pre_description(
            "Text must be a non-empty string and database must be a list of valid company "
            "records with 'id', 'name', and 'url' fields")
      | with_post_description(
            "Returns a list of company records that were found in the text, preserving "
            "database structure with id, name, and url");
  return fn;
}

CompanyList sample_company_database() {
  return {
      {1, "Apple Inc.", "https://apple.com"},
      {2, "Microsoft Corporation", "https://microsoft.com"},
      {3, "Google LLC", "https://google.com"},
  };
}

}  // namespace pactum::examples
