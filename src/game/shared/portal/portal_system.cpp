//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
//=============================================================================//

#include "portal_system.h"
#include "prop_portal_shared.h"
#include "portal_teleport.h"
#include "c_portal_camera_sync.h"
#include "iportalphysics.h"
#include "iportalscene.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

CPortalFireInput::CPortalFireInput( void )
	: m_nButtons( 0 ),
	  m_nOldButtons( 0 ),
	  m_vAimOrigin( vec3_origin ),
	  m_vAimDirection( 1.0f, 0.0f, 0.0f )
{
}

void CPortalFireInput::Update( int nButtons, const Vector &vAimOrigin, const Vector &vAimDirection )
{
	m_nButtons = nButtons;
	m_vAimOrigin = vAimOrigin;
	m_vAimDirection = vAimDirection;
}

int CPortalFireInput::ConsumePressed( void )
{
	int nPressed = m_nButtons & ~m_nOldButtons;
	m_nOldButtons = m_nButtons;
	return nPressed;
}

CPortalSystem::CPortalSystem( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene )
	: m_pPhysics( pPhysics ),
	  m_pScene( pScene ),
	  m_PortalPair( pPhysics, pScene, &m_CollisionGate )
{
}

CPortalSystem::~CPortalSystem( void )
{
	m_PortalPair.RemoveAllPortals();
}

void CPortalSystem::AddTeleportable( CBaseHandle hEntity, PortalTeleportableType_t type )
{
	if ( IsTeleportable( hEntity ) )
		return;

	PortalTeleportable_t teleportable;
	teleportable.hEntity = hEntity;
	teleportable.type = type;
	m_Teleportables.AddToTail( teleportable );
}

void CPortalSystem::RemoveTeleportable( CBaseHandle hEntity )
{
	for ( int i = m_Teleportables.Count() - 1; i >= 0; --i )
	{
		if ( m_Teleportables[i].hEntity == hEntity )
			m_Teleportables.Remove( i );
	}
}

bool CPortalSystem::IsTeleportable( CBaseHandle hEntity ) const
{
	for ( int i = 0; i != m_Teleportables.Count(); ++i )
	{
		if ( m_Teleportables[i].hEntity == hEntity )
			return true;
	}
	return false;
}

void CPortalSystem::SetPlayer( CBaseHandle hBody, CBaseHandle hCameraAnchor )
{
	if ( m_PlayerState.IsValid() )
		RemoveTeleportable( m_PlayerState.m_hBody );

	m_PlayerState.Init( hBody, hCameraAnchor );
	AddTeleportable( hBody, PORTAL_TELEPORTABLE_PLAYER );
}

void CPortalSystem::RunFrame( float flFrameTime )
{
	RunPlacement();
	RunCameraCreation();
	RunCameraSync();
	RunCollisionGating();
	RunTeleport();
	RunRollAnimation( flFrameTime );
	RunKinematicCountdown( flFrameTime );
}

void CPortalSystem::RunPlacement( void )
{
	int nPressed = m_FireInput.ConsumePressed();

	if ( nPressed & IN_FIRE_PORTAL_A )
		m_PortalPair.FirePortal( PORTAL_SLOT_A, m_FireInput.GetAimOrigin(), m_FireInput.GetAimDirection() );

	if ( nPressed & IN_FIRE_PORTAL_B )
		m_PortalPair.FirePortal( PORTAL_SLOT_B, m_FireInput.GetAimOrigin(), m_FireInput.GetAimDirection() );
}

int CPortalSystem::RunCameraCreation( void )
{
	return m_PortalPair.CreatePortalCameras();
}

bool CPortalSystem::RunCameraSync( void )
{
	CProp_Portal *pPortalA = m_PortalPair.GetPortal( PORTAL_SLOT_A );
	CProp_Portal *pPortalB = m_PortalPair.GetPortal( PORTAL_SLOT_B );
	if ( !pPortalA || !pPortalB )
		return false;

	return PortalCamera_SyncPair( m_pScene, m_PortalPair.GetMainCamera(), pPortalA, pPortalB );
}

void CPortalSystem::RunCollisionGating( void )
{
	m_CollisionGate.ProcessCollisionEvents( m_pPhysics, m_PortalPair.GetPortals(), m_Teleportables );
}

int CPortalSystem::RunTeleport( void )
{
	if ( !m_PortalPair.IsLinked() )
		return 0;

	CProp_Portal *pPortalA = m_PortalPair.GetPortal( PORTAL_SLOT_A );
	CProp_Portal *pPortalB = m_PortalPair.GetPortal( PORTAL_SLOT_B );

	CPortalPairTransforms transforms( pPortalA, pPortalB );

	int iTeleported = Portal_TeleportProps( m_pPhysics, transforms, pPortalA, pPortalB, m_Teleportables );
	if ( Portal_TeleportPlayer( m_pPhysics, m_pScene, transforms, pPortalA, pPortalB, m_PlayerState ) )
		++iTeleported;

	return iTeleported;
}

void CPortalSystem::RunRollAnimation( float flFrameTime )
{
	if ( m_PlayerState.IsValid() )
		m_PlayerState.AnimateRoll( m_pPhysics, m_pScene, flFrameTime );
}

void CPortalSystem::RunKinematicCountdown( float flFrameTime )
{
	if ( m_PlayerState.IsValid() )
		m_PlayerState.UpdateKinematicWindow( m_pPhysics, flFrameTime );
}

void CPortalSystem::GetPhysicsTimestep( float flFrameTime, float *pflStep, int *pnSubsteps ) const
{
	int nSubsteps = MAX( portal_physics_substeps.GetInt(), 1 );
	float flClamped = MIN( flFrameTime, portal_physics_max_dt.GetFloat() );

	*pnSubsteps = nSubsteps;
	*pflStep = flClamped / nSubsteps;
}
