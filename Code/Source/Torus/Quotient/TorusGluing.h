/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_QUOTIENT_TORUS_GLUING_H
#define TORUS_QUOTIENT_TORUS_GLUING_H

/**
 * @file TorusGluing.h
 * @brief Identifications turning a box complex into a torus or a torus quotient
 */

#include "Complex/BoxComplex.h"
#include "Quotient/SimplexRelation.h"
#include "Symmetry/GroupGenerator.h"

#include <vector>

namespace torus {

/**
 * @brief Glue opposite faces of the box
 *
 * Every codimension-1 simplex on the face x_i = 0 is identified with its
 * translate on the face x_i = side_i, for every axis i. The relation refers
 * to the cells of @p box, which must outlive it.
 *
 * @throws ConsistencyException if a translate is missing from the complex
 * @throws VertexOrderError if a translate has a different vertex order
 */
SimplexRelation torus_relation(BoxComplex& box);

/**
 * @brief Torus gluing plus identification of every top-dimensional orbit
 * @throws InvalidGroupActionException if the generators do not preserve
 *         the top-dimensional simplices
 */
SimplexRelation quotient_relation(BoxComplex& box, const std::vector<GroupGenerator>& generators);

/// Quotient cells of the torus gluing
QuotientCells torus_cells(BoxComplex& box);

/// Quotient cells of the torus modulo the group
QuotientCells quotient_cells(BoxComplex& box, const std::vector<GroupGenerator>& generators);

} // namespace torus

#endif // TORUS_QUOTIENT_TORUS_GLUING_H
