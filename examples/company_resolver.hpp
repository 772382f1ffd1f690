#pragma once

// Company name resolution stub: finds known company names in free text.

#include <string>
#include <vector>

#include "pactum/contract.hpp"

namespace pactum::examples {

struct CompanyRecord {
  int id{0};
  std::string name;
  std::string url;
};

using CompanyList = std::vector<CompanyRecord>;

const Contracted<CompanyList(const std::string&, const CompanyList&)>& resolve_company_names();

CompanyList sample_company_database();

}  // namespace pactum::examples
