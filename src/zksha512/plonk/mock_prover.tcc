#ifndef ZKSHA512_PLONK_MOCK_PROVER_TCC_
#define ZKSHA512_PLONK_MOCK_PROVER_TCC_

#include <algorithm>
#include <map>

#include <gmp.h>
#include <boost/functional/hash.hpp>
#include <boost/unordered_set.hpp>

#include "logging.h"

namespace libzksha512 {

typedef std::vector<mp_limb_t> lookup_key;

template<typename FieldT>
void append_lookup_key(lookup_key& key, const FieldT& value)
{
    auto repr = value.as_bigint();
    key.insert(key.end(), repr.data, repr.data + FieldT::num_limbs);
}

template<typename FieldT>
mock_prover<FieldT>::mock_prover(const layouter<FieldT>& l,
                                 const std::vector<std::vector<FieldT>>& instance) :
    cs_(l.cs()), table_(l.table()), regions_(l.regions()), instance_(instance),
    rows_(std::max(l.rows_used(), l.table().num_rows()))
{
}

template<typename FieldT>
mock_prover<FieldT>::mock_prover(const constraint_system<FieldT>& cs,
                                 const witness_table<FieldT>& table,
                                 const std::vector<std::vector<FieldT>>& instance) :
    cs_(cs), table_(table), instance_(instance), rows_(table.num_rows())
{
}

template<typename FieldT>
FieldT mock_prover<FieldT>::cell_value(const column& col, long row) const
{
    if (row < 0) {
        return FieldT::zero();
    }
    if (col.type == INSTANCE_COLUMN) {
        if (col.index >= instance_.size() || (size_t)row >= instance_[col.index].size()) {
            return FieldT::zero();
        }
        return instance_[col.index][row];
    }
    return table_.value(cell(col, row));
}

template<typename FieldT>
std::string mock_prover<FieldT>::region_at(size_t row) const
{
    for (const auto& r : regions_) {
        if (r.contains(row)) {
            return r.name;
        }
    }
    return "";
}

template<typename FieldT>
std::vector<verify_failure> mock_prover<FieldT>::verify() const
{
    std::vector<verify_failure> failures;

    for (size_t row = 0; row < rows_; row++) {
        auto query = [&](const column& col, int rotation) {
            return cell_value(col, (long)row + rotation);
        };
        auto selected = [&](const selector& sel) {
            return table_.is_enabled(sel, row);
        };

        for (const auto& g : cs_.gates()) {
            if (!table_.is_enabled(g.sel, row)) {
                continue;
            }
            for (const auto& poly : g.polys) {
                if (poly.second.evaluate(query, selected) != FieldT::zero()) {
                    verify_failure f;
                    f.type = CONSTRAINT_NOT_SATISFIED;
                    f.name = g.name;
                    f.constraint = poly.first;
                    f.row = row;
                    f.region = region_at(row);
                    failures.push_back(f);
                }
            }
        }
    }

    std::map<const lookup_table<FieldT>*, boost::unordered_set<lookup_key>> tables;
    for (const auto& arg : cs_.lookups()) {
        auto& keys = tables[arg.table.get()];
        if (keys.empty()) {
            for (const auto& table_row : arg.table->rows()) {
                lookup_key key;
                for (const auto& value : table_row) {
                    append_lookup_key(key, value);
                }
                keys.insert(key);
            }
        }

        for (size_t row = 0; row < rows_; row++) {
            auto query = [&](const column& col, int rotation) {
                return cell_value(col, (long)row + rotation);
            };
            auto selected = [&](const selector& sel) {
                return table_.is_enabled(sel, row);
            };

            lookup_key key;
            for (const auto& input : arg.inputs) {
                append_lookup_key(key, input.evaluate(query, selected));
            }
            if (keys.count(key) == 0) {
                verify_failure f;
                f.type = LOOKUP_NOT_SATISFIED;
                f.name = arg.name;
                f.row = row;
                f.region = region_at(row);
                failures.push_back(f);
            }
        }
    }

    for (const auto& cls : table_.copies().classes()) {
        FieldT expected = cell_value(cls[0].col, cls[0].row);
        for (size_t i = 1; i < cls.size(); i++) {
            if (cell_value(cls[i].col, cls[i].row) != expected) {
                verify_failure f;
                f.type = PERMUTATION_NOT_SATISFIED;
                f.row = cls[i].row;
                f.first = cls[0];
                f.second = cls[i];
                failures.push_back(f);
            }
        }
    }

    for (size_t i = 0; i < failures.size() && i < MAX_LOGGED_FAILURES; i++) {
        LogError("zksha512", "%s\n", failures[i].to_string());
    }
    if (failures.size() > MAX_LOGGED_FAILURES) {
        LogError("zksha512", "%d further failures not shown\n", failures.size() - MAX_LOGGED_FAILURES);
    }
    LogPrint("zksha512", "mock prover checked %d rows: %d failures\n", rows_, failures.size());

    return failures;
}

} // libzksha512

#endif // ZKSHA512_PLONK_MOCK_PROVER_TCC_
