#pragma once
#include <set>
#include <string>
#include <utility>

/**
 * Set of input column names the downstream tax-calculation engine accepts.
 * Drop and skip lists are validated against it before any data is touched.
 */
class SchemaRegistry {
public:
    virtual ~SchemaRegistry() = default;
    virtual bool isKnown(const std::string& name) const = 0;
};

class ColumnSchemaRegistry final : public SchemaRegistry {
public:
    explicit ColumnSchemaRegistry(std::set<std::string> names) : names_(std::move(names)) {}

    /**
     * @brief Input variables read by the tax-calculation engine's Records class.
     */
    static ColumnSchemaRegistry taxCalculatorInputs();

    /**
     * @brief Loads one column name per line; blank lines and '#' comments are ignored.
     * @throws TaxSynth::IOException when the file cannot be opened.
     * @throws TaxSynth::ConfigurationException when the file lists no names.
     */
    static ColumnSchemaRegistry fromFile(const std::string& path);

    bool isKnown(const std::string& name) const override { return names_.count(name) > 0; }

private:
    std::set<std::string> names_;
};
