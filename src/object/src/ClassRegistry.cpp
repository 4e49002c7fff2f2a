// /////////////////////////////////////////////////////////////////////////////
/// @file ClassRegistry.cpp
/// @brief ClassRegistry implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/object/ClassRegistry.hpp>
#include <zbson/core/Log.hpp>

#include <map>

namespace zbson::object {

struct ClassRegistry::Impl
{
    std::map<std::string, Factory, std::less<>> factories;
};

ClassRegistry::ClassRegistry()
    : impl_{std::make_unique<Impl>()}
{}

ClassRegistry::~ClassRegistry() = default;

ClassRegistry::ClassRegistry(ClassRegistry&&) noexcept = default;
ClassRegistry& ClassRegistry::operator=(ClassRegistry&&) noexcept = default;

void ClassRegistry::add(std::string typeName, Factory factory)
{
    auto [it, inserted] = impl_->factories.insert_or_assign(std::move(typeName), std::move(factory));
    if (!inserted)
    {
        core::Log::info("registry", "replaced factory for class " + it->first);
        return;
    }
    core::Log::debug("registry", "registered class " + it->first);
}

bool ClassRegistry::contains(std::string_view typeName) const noexcept
{
    return impl_->factories.find(typeName) != impl_->factories.end();
}

const Factory* ClassRegistry::find(std::string_view typeName) const noexcept
{
    auto it = impl_->factories.find(typeName);
    return (it != impl_->factories.end()) ? &it->second : nullptr;
}

core::usize ClassRegistry::size() const noexcept
{
    return impl_->factories.size();
}

core::Expected<value::Value> ClassRegistry::instantiate(
    std::string_view typeName, const value::Document& document) const
{
    const Factory* factory = find(typeName);
    if (factory == nullptr)
    {
        return core::makeError(core::ErrorCode::kMissingClassDefinition,
                               "No class definition for class " + std::string{typeName});
    }
    return (*factory)(document);
}

} // namespace zbson::object
