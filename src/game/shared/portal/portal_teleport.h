//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Moves props and the player through a linked portal pair.
//
// $NoKeywords: $
//=============================================================================//

#ifndef PORTAL_TELEPORT_H
#define PORTAL_TELEPORT_H

#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/vmatrix.h"
#include "tier1/utlvector.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

class CProp_Portal;
class CPortalPlayerState;
class IPortalPhysicsWorld;
class IPortalSceneHost;

// The two portal matrices of a pair, each built the first time it's asked for.
// Lives for one tick so every entity crossing that tick sees the same matrices.
class CPortalPairTransforms
{
public:
	CPortalPairTransforms( const CProp_Portal *pPortalA, const CProp_Portal *pPortalB );

	const VMatrix&		MatrixThisToLinked( const CProp_Portal *pSource );
	int					GetBuildCount( void ) const { return m_iBuildCount; }

private:
	const CProp_Portal	*m_pPortals[PORTAL_SLOT_COUNT];
	VMatrix				m_matThisToLinked[PORTAL_SLOT_COUNT];
	bool				m_bBuilt[PORTAL_SLOT_COUNT];
	int					m_iBuildCount;
};

// Portal the point is passing through, if any. The point has to be within flThreshold of the
// clip point and behind the surface. Portal A wins if the point is near both.
const CProp_Portal *Portal_FindCrossing( const Vector &ptEntity, float flThreshold, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB );

// True if the point is already behind the portal it's near, or vVelocity carries it
// through that portal's surface within flWindow seconds. Same A-first rule as Portal_FindCrossing.
bool Portal_IsCrossingPending( const Vector &ptEntity, const Vector &vVelocity, float flThreshold, float flWindow, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB );

// Raises the velocity component along vExitDir (unit length) to portal_min_exit_speed
void Portal_ApplyMinimumExitSpeed( const Vector &vExitDir, Vector *pVelocity );

// Returns the number of props teleported
int Portal_TeleportProps( IPortalPhysicsWorld *pPhysics, CPortalPairTransforms &transforms, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB, const CUtlVector<PortalTeleportable_t> &teleportables );

// Returns true if the player went through a portal this tick
bool Portal_TeleportPlayer( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene, CPortalPairTransforms &transforms, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB, CPortalPlayerState &player );

#endif //PORTAL_TELEPORT_H
