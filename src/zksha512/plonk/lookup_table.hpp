#ifndef ZKSHA512_PLONK_LOOKUP_TABLE_HPP_
#define ZKSHA512_PLONK_LOOKUP_TABLE_HPP_

#include <string>
#include <vector>

namespace libzksha512 {

/**
 * A fixed relation used as the right-hand side of lookup arguments.
 * Tables are filled once and then only read, so one instance can back any
 * number of constraint systems and proofs.
 */
template<typename FieldT>
class lookup_table {
protected:
    std::string name_;
    size_t arity_;
    std::vector<std::vector<FieldT>> rows_;

public:
    lookup_table(const std::string& name, size_t arity) : name_(name), arity_(arity) {}
    virtual ~lookup_table() {}

    const std::string& name() const { return name_; }
    size_t arity() const { return arity_; }
    size_t size() const { return rows_.size(); }
    const std::vector<std::vector<FieldT>>& rows() const { return rows_; }
};

} // libzksha512

#endif // ZKSHA512_PLONK_LOOKUP_TABLE_HPP_
