/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_QUOTIENT_SIMPLEX_RELATION_H
#define TORUS_QUOTIENT_SIMPLEX_RELATION_H

/**
 * @file SimplexRelation.h
 * @brief Equivalence relation on the simplices of a complex
 *
 * Identifying simplices identifies their boundaries pointwise: face i of
 * each identified simplex is identified with face i of the others, down to
 * vertices. The quotient of the complex by the relation is again a cell
 * complex whose cells are the equivalence classes.
 *
 * All members of a class share one immutable SimplexClass object. Classes
 * are ordered by their smallest member, which is unique per class.
 */

#include "Complex/CellComplex.h"
#include "Core/Types.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace torus {

/**
 * @brief Immutable set of identified simplices
 */
class SimplexClass {
public:
    explicit SimplexClass(std::set<Simplex> members);

    const std::set<Simplex>& members() const { return members_; }
    size_t size() const { return members_.size(); }
    bool contains(const Simplex& simplex) const { return members_.count(simplex) > 0; }

    /// Smallest member
    const Simplex& representative() const { return *members_.begin(); }

private:
    std::set<Simplex> members_;
};

using ClassRef = std::shared_ptr<const SimplexClass>;

struct ClassLess {
    bool operator()(const ClassRef& a, const ClassRef& b) const {
        return a->representative() < b->representative();
    }
};

using QuotientCells = CellComplex<ClassRef, ClassLess>;

std::string to_string(const SimplexClass& cls);

class SimplexRelation {
public:
    /**
     * @brief Relation over the simplices of @p complex
     *
     * The complex must outlive the relation.
     */
    explicit SimplexRelation(const SimplexCells& complex);

    /**
     * @brief Merge the classes of the given simplices and of their faces
     *
     * @throws InvalidArgumentException if a simplex is not in the complex
     *         or the simplices differ in size
     */
    void identify(const std::vector<Simplex>& simplices);

    void identify(const Simplex& a, const Simplex& b) { identify(std::vector<Simplex>{a, b}); }

    /**
     * @brief Equivalence class of a simplex (a singleton if never identified)
     */
    ClassRef class_of(const Simplex& simplex) const;

    bool equivalent(const Simplex& a, const Simplex& b) const;

    /// Number of non-singleton classes
    size_t n_classes() const;

    /**
     * @brief Check that every identification commutes with the boundary maps
     *
     * For each pair (src, dst) of one class the positional correspondence
     * of their vertices must carry every face of src onto the face of dst
     * with the same index, and the two faces must be equivalent.
     *
     * @throws ConsistencyException naming the offending vertices or faces
     */
    void validate() const;

    /**
     * @brief Quotient complex whose cells are the equivalence classes
     */
    QuotientCells quotient() const;

private:
    const SimplexCells& complex_;
    std::map<Simplex, ClassRef> class_map_;

    void merge(const std::vector<Simplex>& simplices);
};

} // namespace torus

#endif // TORUS_QUOTIENT_SIMPLEX_RELATION_H
