//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
// $NoKeywords: $
//=============================================================================//

#include "portal_collision_gating.h"
#include "prop_portal_shared.h"
#include "iportalphysics.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

static bool IsTeleportable( const CUtlVector<PortalTeleportable_t> &teleportables, CBaseHandle hEntity )
{
	for ( int i = 0; i != teleportables.Count(); ++i )
	{
		if ( teleportables[i].hEntity == hEntity )
			return true;
	}
	return false;
}

static const CProp_Portal *FindPortalBySensor( CProp_Portal * const pPortals[PORTAL_SLOT_COUNT], CBaseHandle hSensor )
{
	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
	{
		if ( pPortals[i] && pPortals[i]->GetEntityHandle() == hSensor )
			return pPortals[i];
	}
	return NULL;
}

CPortal_CollisionGate::CPortal_CollisionGate( void )
{
	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
		m_RelaxedOrientation[i] = PORTAL_ORIENTATION_OTHER;
}

void CPortal_CollisionGate::ProcessCollisionEvents( IPortalPhysicsWorld *pPhysics, CProp_Portal * const pPortals[PORTAL_SLOT_COUNT], const CUtlVector<PortalTeleportable_t> &teleportables )
{
	int iEventCount = pPhysics->GetCollisionEventCount();
	for ( int i = 0; i != iEventCount; ++i )
	{
		const PortalCollisionEvent_t &event = pPhysics->GetCollisionEvent( i );

		// either body may be the sensor
		CBaseHandle hEntity;
		const CProp_Portal *pPortal = FindPortalBySensor( pPortals, event.hBody0 );
		if ( pPortal )
		{
			hEntity = event.hBody1;
		}
		else
		{
			pPortal = FindPortalBySensor( pPortals, event.hBody1 );
			hEntity = event.hBody0;
		}

		if ( !pPortal || !IsTeleportable( teleportables, hEntity ) )
			continue;

		if ( event.type == PORTAL_COLLISION_EVENT_START )
			StartTouch( pPhysics, pPortal, hEntity );
		else
			EndTouch( pPhysics, pPortal->GetSlot(), hEntity );
	}

	pPhysics->ClearCollisionEvents();
}

void CPortal_CollisionGate::StartTouch( IPortalPhysicsWorld *pPhysics, const CProp_Portal *pPortal, CBaseHandle hEntity )
{
	PortalSlot_t slot = pPortal->GetSlot();

	if ( !m_Contacts[slot].HasElement( hEntity ) )
		m_Contacts[slot].AddToTail( hEntity );

	m_RelaxedOrientation[slot] = pPortal->GetOrientation();

	if ( m_Relaxed[slot].HasElement( hEntity ) )
		return;

	m_Relaxed[slot].AddToTail( hEntity );
	pPhysics->SetBodyCollisionFilter( hEntity, RelaxedFilter( hEntity ) );

	if ( portal_debug_teleport.GetBool() )
		DevMsg( "Portal %s: relaxed collision for entity %d\n", PortalSlot_Name( slot ), hEntity.ToInt() );
}

void CPortal_CollisionGate::EndTouch( IPortalPhysicsWorld *pPhysics, PortalSlot_t slot, CBaseHandle hEntity )
{
	m_Contacts[slot].FindAndRemove( hEntity );

	// only once nothing at all is overlapping the portal
	if ( m_Contacts[slot].Count() == 0 )
		RestoreRelaxed( pPhysics, slot );
}

void CPortal_CollisionGate::OnPortalRemoved( IPortalPhysicsWorld *pPhysics, PortalSlot_t slot )
{
	m_Contacts[slot].RemoveAll();
	RestoreRelaxed( pPhysics, slot );
}

// Only what every portal relaxing the entity lets through
unsigned int CPortal_CollisionGate::RelaxedFilter( CBaseHandle hEntity ) const
{
	unsigned int fFilter = PORTAL_COLLISION_ALL;

	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
	{
		if ( m_Relaxed[i].HasElement( hEntity ) )
			fFilter &= PortalRelaxedCollisionMask( m_RelaxedOrientation[i] );
	}

	return fFilter;
}

void CPortal_CollisionGate::RestoreRelaxed( IPortalPhysicsWorld *pPhysics, PortalSlot_t slot )
{
	CUtlVector<CBaseHandle> relaxed;
	relaxed.Swap( m_Relaxed[slot] );

	for ( int i = 0; i != relaxed.Count(); ++i )
	{
		CBaseHandle hEntity = relaxed[i];

		// keeps whatever the other portal still relaxes
		unsigned int fFilter = RelaxedFilter( hEntity );
		pPhysics->SetBodyCollisionFilter( hEntity, fFilter );

		if ( fFilter == (unsigned int)PORTAL_COLLISION_ALL && portal_debug_teleport.GetBool() )
			DevMsg( "Portal %s: restored collision for entity %d\n", PortalSlot_Name( slot ), hEntity.ToInt() );
	}
}
