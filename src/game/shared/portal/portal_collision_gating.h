//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Lets teleportables pass into the wall a portal is cut into while
//			they overlap the portal's sensor volume.
//
// $NoKeywords: $
//=============================================================================//

#ifndef PORTAL_COLLISION_GATING_H
#define PORTAL_COLLISION_GATING_H

#ifdef _WIN32
#pragma once
#endif

#include "tier1/utlvector.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

class CProp_Portal;
class IPortalPhysicsWorld;

class CPortal_CollisionGate
{
public:
	CPortal_CollisionGate( void );

	// Drains the physics collision queue
	void	ProcessCollisionEvents( IPortalPhysicsWorld *pPhysics, CProp_Portal * const pPortals[PORTAL_SLOT_COUNT], const CUtlVector<PortalTeleportable_t> &teleportables );

	// Puts back everything the portal in this slot relaxed and forgets its contacts
	void	OnPortalRemoved( IPortalPhysicsWorld *pPhysics, PortalSlot_t slot );

	int		GetContactCount( PortalSlot_t slot ) const { return m_Contacts[slot].Count(); }
	bool	IsTouching( PortalSlot_t slot, CBaseHandle hEntity ) const { return m_Contacts[slot].HasElement( hEntity ); }
	bool	IsRelaxedBy( PortalSlot_t slot, CBaseHandle hEntity ) const { return m_Relaxed[slot].HasElement( hEntity ); }

private:
	void	StartTouch( IPortalPhysicsWorld *pPhysics, const CProp_Portal *pPortal, CBaseHandle hEntity );
	void	EndTouch( IPortalPhysicsWorld *pPhysics, PortalSlot_t slot, CBaseHandle hEntity );
	void	RestoreRelaxed( IPortalPhysicsWorld *pPhysics, PortalSlot_t slot );
	unsigned int RelaxedFilter( CBaseHandle hEntity ) const;

	CUtlVector<CBaseHandle>	m_Contacts[PORTAL_SLOT_COUNT];		//entities currently overlapping each portal
	CUtlVector<CBaseHandle>	m_Relaxed[PORTAL_SLOT_COUNT];		//entities whose filter each portal has relaxed
	PortalOrientation_t		m_RelaxedOrientation[PORTAL_SLOT_COUNT];
};

#endif //#ifndef PORTAL_COLLISION_GATING_H
