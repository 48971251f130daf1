//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
//=============================================================================//

#include "portal_placement.h"
#include "prop_portal_shared.h"
#include "portal_util_shared.h"
#include "portal_collision_gating.h"
#include "c_portal_camera.h"
#include "iportalphysics.h"
#include "iportalscene.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

PortalFizzleType_t TraceFirePortal( IPortalPhysicsWorld *pPhysics, const Vector &vTraceStart, const Vector &vDirection, PortalPlacement_t *pPlacement )
{
	Vector vShotDir = vDirection;
	if ( VectorNormalize( vShotDir ) < PORTAL_DEGENERATE_EPSILON )
		return PORTAL_FIZZLE_NONE;

	// Trace to see where the portal hit
	PortalTrace_t tr;
	if ( !pPhysics->TraceRay( vTraceStart, vShotDir, portal_fire_max_distance.GetFloat(), true, MASK_PORTAL_STATIC_GEOMETRY, &tr ) )
		return PORTAL_FIZZLE_NONE;

	Vector vNormal = tr.normal;
	if ( VectorNormalize( vNormal ) < PORTAL_DEGENERATE_EPSILON )
		return PORTAL_FIZZLE_BAD_SURFACE;

	PortalOrientation_t orientation = UTIL_Portal_ClassifyOrientation( vNormal );

	Vector vUp;
	if ( !UTIL_Portal_ComputeUpAxis( vNormal, vShotDir, orientation, &vUp ) )
		return PORTAL_FIZZLE_BAD_SURFACE;

	Vector ptSurface = tr.endpos + vNormal * PORTAL_Z_FIGHTING_OFFSET;
	ptSurface = UTIL_Portal_AdjustOriginToObstacles( pPhysics, ptSurface, vNormal, vUp );

	// Sink the portal into the wall so its clip plane, not its center, is on the surface
	Vector ptOrigin = ptSurface - vNormal * portal_mesh_depth.GetFloat();

	UTIL_Portal_BuildTransform( ptOrigin, vNormal, vUp, portal_scale.GetFloat(), pPlacement->portalToWorld );
	pPlacement->orientation = orientation;
	pPlacement->vSurfacePoint = ptSurface;

	return PORTAL_FIZZLE_SUCCESS;
}

CPortalPair::CPortalPair( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene, CPortal_CollisionGate *pGate )
	: m_pPhysics( pPhysics ),
	  m_pScene( pScene ),
	  m_pGate( pGate )
{
	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
		m_pPortals[i] = NULL;
}

CPortalPair::~CPortalPair( void )
{
	RemoveAllPortals();
}

PortalFizzleType_t CPortalPair::FirePortal( PortalSlot_t slot, const Vector &vTraceStart, const Vector &vDirection, CBaseHandle *phPortal )
{
	Assert( slot >= 0 && slot < PORTAL_SLOT_COUNT );

	PortalPlacement_t placement;
	PortalFizzleType_t fizzle = TraceFirePortal( m_pPhysics, vTraceStart, vDirection, &placement );
	if ( fizzle != PORTAL_FIZZLE_SUCCESS )
	{
		if ( portal_debug_placement.GetBool() )
			DevMsg( "Portal %s fizzled (%d)\n", PortalSlot_Name( slot ), fizzle );
		return fizzle;
	}

	// The old portal stays up if the host can't make the new one
	CBaseHandle hEntity = m_pScene->CreatePortalEntity( slot, placement.portalToWorld, placement.orientation );
	if ( !hEntity.IsValid() )
	{
		Warning( "Portal %s: host failed to create the portal entity\n", PortalSlot_Name( slot ) );
		return PORTAL_FIZZLE_BAD_SURFACE;
	}

	// one portal per slot
	RemovePortal( slot );

	CProp_Portal *pPortal = new CProp_Portal( slot, hEntity );
	pPortal->PlacePortal( placement.portalToWorld, placement.orientation );
	m_pPortals[slot] = pPortal;

	UpdatePortalLinkage();

	if ( portal_debug_placement.GetBool() )
	{
		DevMsg( "Portal %s placed at (%.2f %.2f %.2f) facing (%.2f %.2f %.2f)%s\n", PortalSlot_Name( slot ),
			placement.vSurfacePoint.x, placement.vSurfacePoint.y, placement.vSurfacePoint.z,
			pPortal->m_vForward.x, pPortal->m_vForward.y, pPortal->m_vForward.z,
			( placement.orientation == PORTAL_ORIENTATION_HORIZONTAL ) ? " horizontal" : "" );
	}

	if ( phPortal )
		*phPortal = hEntity;

	return PORTAL_FIZZLE_SUCCESS;
}

void CPortalPair::RemovePortal( PortalSlot_t slot )
{
	CProp_Portal *pPortal = m_pPortals[slot];
	if ( !pPortal )
		return;

	if ( m_pGate )
		m_pGate->OnPortalRemoved( m_pPhysics, slot );

	// camera goes with its portal
	C_PortalCamera *pCamera = pPortal->DetachCamera();
	if ( pCamera )
	{
		m_pScene->DestroyEntity( pCamera->GetEntityHandle() );
		delete pCamera;
	}

	m_pScene->DestroyEntity( pPortal->GetEntityHandle() );

	m_pPortals[slot] = NULL;
	pPortal->SetLinkedPortal( NULL );
	UpdatePortalLinkage();

	delete pPortal;

	if ( portal_debug_placement.GetBool() )
		DevMsg( "Portal %s removed\n", PortalSlot_Name( slot ) );
}

void CPortalPair::RemoveAllPortals( void )
{
	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
		RemovePortal( (PortalSlot_t)i );
}

CBaseHandle CPortalPair::GetMainCamera( void )
{
	if ( m_hMainCamera.IsValid() )
	{
		matrix3x4_t cameraToWorld;
		if ( m_pScene->GetWorldTransform( m_hMainCamera, cameraToWorld ) )
			return m_hMainCamera;

		// it's gone, find the new one
		m_hMainCamera.Term();
	}

	m_hMainCamera = m_pScene->FindMainCamera();
	return m_hMainCamera;
}

int CPortalPair::CreatePortalCameras( void )
{
	if ( !GetMainCamera().IsValid() )
		return 0;

	int iCreated = 0;
	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
	{
		CProp_Portal *pPortal = m_pPortals[i];
		if ( !pPortal || pPortal->GetCamera() )
			continue;

		// draw before the main camera, which is at 0
		int iRenderPriority = -1 - i;
		CBaseHandle hCamera = m_pScene->CreatePortalCamera( (PortalSlot_t)i, iRenderPriority );
		if ( !hCamera.IsValid() )
		{
			Warning( "Portal %s: host failed to create the portal camera\n", PortalSlot_Name( (PortalSlot_t)i ) );
			continue;
		}

		pPortal->AttachCamera( new C_PortalCamera( pPortal, hCamera ) );
		++iCreated;

		if ( portal_debug_placement.GetBool() )
			DevMsg( "Portal %s camera created (priority %d)\n", PortalSlot_Name( (PortalSlot_t)i ), iRenderPriority );
	}

	return iCreated;
}

bool CPortalPair::IsLinked( void ) const
{
	return m_pPortals[PORTAL_SLOT_A] && m_pPortals[PORTAL_SLOT_B] &&
		   m_pPortals[PORTAL_SLOT_A]->GetLinkedPortal() == m_pPortals[PORTAL_SLOT_B];
}

void CPortalPair::UpdatePortalLinkage( void )
{
	CProp_Portal *pPortalA = m_pPortals[PORTAL_SLOT_A];
	CProp_Portal *pPortalB = m_pPortals[PORTAL_SLOT_B];

	if ( pPortalA )
		pPortalA->SetLinkedPortal( pPortalB );
	if ( pPortalB )
		pPortalB->SetLinkedPortal( pPortalA );

	RefreshSurfaceStates();
}

void CPortalPair::RefreshSurfaceStates( void )
{
	bool bLinked = IsLinked();
	for ( int i = 0; i != PORTAL_SLOT_COUNT; ++i )
	{
		if ( m_pPortals[i] )
			m_pScene->SetPortalSurfaceState( m_pPortals[i]->GetEntityHandle(), bLinked );
	}
}
