#ifndef MINTCRATE_ACTIVE_INTERNAL_H
#define MINTCRATE_ACTIVE_INTERNAL_H

#include "mintcrate/active.h"

/*
 * Mutable access to an Active's collider shape for the collision query
 * functions, which are the only code allowed to write its flags.
 * Returns NULL for a NULL active.
 */
MintCrate_Shape *mintcrate_active_collider_shape(MintCrate_Active *active);

#endif /* MINTCRATE_ACTIVE_INTERNAL_H */
