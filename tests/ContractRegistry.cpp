#include "ContractRegistry.h"

#include <cctype>

namespace decksync::tests
{

ContractRegistry& ContractRegistry::Instance()
{
  static ContractRegistry registry;
  return registry;
}

void ContractRegistry::Record(const std::string& domain, const std::string& rule_id,
                              const std::string& test_name)
{
  std::lock_guard<std::mutex> lock(mutex_);
  coverage_[domain][rule_id].insert(test_name);
}

std::vector<std::string> ContractRegistry::Uncovered(
    const std::string& domain, const std::vector<std::string>& expected) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> uncovered;
  const auto domain_it = coverage_.find(domain);
  for (const auto& rule : expected)
  {
    if (domain_it == coverage_.end() || domain_it->second.count(rule) == 0)
    {
      uncovered.push_back(rule);
    }
  }
  return uncovered;
}

std::size_t ContractRegistry::CoveredRuleCount(const std::string& domain) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = coverage_.find(domain);
  return it == coverage_.end() ? 0 : it->second.size();
}

std::string RuleIdFromTestName(const std::string& test_name)
{
  // PREFIX_NNN_...: three upper-case letters, underscore, three digits.
  if (test_name.size() < 7 || test_name[3] != '_')
  {
    return {};
  }
  for (std::size_t i = 0; i < 3; ++i)
  {
    if (!std::isupper(static_cast<unsigned char>(test_name[i])) ||
        !std::isdigit(static_cast<unsigned char>(test_name[4 + i])))
    {
      return {};
    }
  }
  return test_name.substr(0, 3) + "-" + test_name.substr(4, 3);
}

} // namespace decksync::tests
