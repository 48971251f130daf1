//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
// $NoKeywords: $
//=============================================================================//

#include "portal_teleport.h"
#include "prop_portal_shared.h"
#include "portal_player_shared.h"
#include "portal_util_shared.h"
#include "iportalphysics.h"
#include "iportalscene.h"
#include "mathlib/mathlib.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

CPortalPairTransforms::CPortalPairTransforms( const CProp_Portal *pPortalA, const CProp_Portal *pPortalB )
	: m_iBuildCount( 0 )
{
	m_pPortals[PORTAL_SLOT_A] = pPortalA;
	m_pPortals[PORTAL_SLOT_B] = pPortalB;
	m_bBuilt[PORTAL_SLOT_A] = false;
	m_bBuilt[PORTAL_SLOT_B] = false;
}

const VMatrix &CPortalPairTransforms::MatrixThisToLinked( const CProp_Portal *pSource )
{
	int iThis = ( pSource == m_pPortals[PORTAL_SLOT_A] ) ? PORTAL_SLOT_A : PORTAL_SLOT_B;
	int iLinked = ( iThis == PORTAL_SLOT_A ) ? PORTAL_SLOT_B : PORTAL_SLOT_A;
	Assert( pSource == m_pPortals[iThis] );

	if ( !m_bBuilt[iThis] )
	{
		UTIL_Portal_PortalToPortal( m_pPortals[iThis]->PortalToWorld(), m_pPortals[iLinked]->PortalToWorld(), &m_matThisToLinked[iThis] );
		m_bBuilt[iThis] = true;
		++m_iBuildCount;
	}

	return m_matThisToLinked[iThis];
}

const CProp_Portal *Portal_FindCrossing( const Vector &ptEntity, float flThreshold, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB )
{
	const CProp_Portal *pPortals[2] = { pPortalA, pPortalB };

	for ( int i = 0; i != 2; ++i )
	{
		const CProp_Portal *pPortal = pPortals[i];
		Vector vOffset = ptEntity - pPortal->m_ptClipPoint;

		if ( vOffset.Length() >= flThreshold )
			continue;

		// Near this portal, so it's this one or none. Past the surface means inside the wall.
		if ( vOffset.Dot( pPortal->m_vForward ) < 0.0f )
			return pPortal;

		return NULL;
	}

	return NULL;
}

bool Portal_IsCrossingPending( const Vector &ptEntity, const Vector &vVelocity, float flThreshold, float flWindow, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB )
{
	const CProp_Portal *pPortals[2] = { pPortalA, pPortalB };

	for ( int i = 0; i != 2; ++i )
	{
		const CProp_Portal *pPortal = pPortals[i];
		Vector vOffset = ptEntity - pPortal->m_ptClipPoint;

		if ( vOffset.Length() >= flThreshold )
			continue;

		float flInFront = vOffset.Dot( pPortal->m_vForward );
		if ( flInFront < 0.0f )
			return true;

		float flClosingSpeed = -vVelocity.Dot( pPortal->m_vForward );
		if ( flClosingSpeed <= 0.0f )
			return false;

		return flInFront <= flClosingSpeed * flWindow;
	}

	return false;
}

void Portal_ApplyMinimumExitSpeed( const Vector &vExitDir, Vector *pVelocity )
{
	float flMinSpeed = portal_min_exit_speed.GetFloat();
	float flExitSpeed = pVelocity->Dot( vExitDir );

	if ( flExitSpeed < flMinSpeed )
		*pVelocity += vExitDir * ( flMinSpeed - flExitSpeed );
}

// Moves the body to newPose and carries its velocity through the portal
static void TeleportBody( IPortalPhysicsWorld *pPhysics, CBaseHandle hBody, const VMatrix &matThisToLinked, const CProp_Portal *pDestination, const matrix3x4_t &newPose )
{
	pPhysics->SetBodyTransform( hBody, newPose );

	Vector vVelocity;
	AngularImpulse vAngularVelocity;
	pPhysics->GetBodyVelocity( hBody, &vVelocity, &vAngularVelocity );

	Vector vNewVelocity = matThisToLinked.ApplyRotation( vVelocity );
	AngularImpulse vNewAngularVelocity = matThisToLinked.ApplyRotation( vAngularVelocity );

	Portal_ApplyMinimumExitSpeed( pDestination->m_vForward, &vNewVelocity );

	pPhysics->SetBodyVelocity( hBody, &vNewVelocity, &vNewAngularVelocity );
}

int Portal_TeleportProps( IPortalPhysicsWorld *pPhysics, CPortalPairTransforms &transforms, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB, const CUtlVector<PortalTeleportable_t> &teleportables )
{
	float flThreshold = portal_prop_proximity.GetFloat();
	int iTeleported = 0;

	for ( int i = 0; i != teleportables.Count(); ++i )
	{
		if ( teleportables[i].type != PORTAL_TELEPORTABLE_PROP )
			continue;

		CBaseHandle hProp = teleportables[i].hEntity;

		matrix3x4_t propToWorld;
		if ( !pPhysics->GetBodyTransform( hProp, propToWorld ) )
			continue;

		const CProp_Portal *pSource = Portal_FindCrossing( UTIL_Portal_Origin( propToWorld ), flThreshold, pPortalA, pPortalB );
		if ( !pSource )
			continue;

		const CProp_Portal *pDestination = pSource->GetLinkedPortal();
		const VMatrix &matThisToLinked = transforms.MatrixThisToLinked( pSource );

		matrix3x4_t newPose;
		UTIL_Portal_TransformPose( matThisToLinked, propToWorld, newPose );
		TeleportBody( pPhysics, hProp, matThisToLinked, pDestination, newPose );

		if ( portal_debug_teleport.GetBool() )
		{
			DevMsg( "PORTAL %s TELEPORTING: prop %d\n", PortalSlot_Name( pSource->GetSlot() ), hProp.ToInt() );
		}

		++iTeleported;
	}

	return iTeleported;
}

bool Portal_TeleportPlayer( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene, CPortalPairTransforms &transforms, const CProp_Portal *pPortalA, const CProp_Portal *pPortalB, CPortalPlayerState &player )
{
	if ( !player.IsValid() )
		return false;

	matrix3x4_t playerRoot;
	if ( !pPhysics->GetBodyTransform( player.m_hBody, playerRoot ) )
		return false;

	float flThreshold = portal_player_proximity.GetFloat();
	Vector ptPlayer = UTIL_Portal_Origin( playerRoot );

	const CProp_Portal *pSource = Portal_FindCrossing( ptPlayer, flThreshold, pPortalA, pPortalB );
	if ( !pSource )
	{
		// About to go through. Armed once, only the teleport restarts it.
		if ( !player.IsKinematic() )
		{
			Vector vVelocity;
			AngularImpulse vAngularVelocity;
			pPhysics->GetBodyVelocity( player.m_hBody, &vVelocity, &vAngularVelocity );

			if ( Portal_IsCrossingPending( ptPlayer, vVelocity, flThreshold, portal_kinematic_window.GetFloat(), pPortalA, pPortalB ) )
				player.ResetKinematicWindow( pPhysics );
		}
		return false;
	}

	const CProp_Portal *pDestination = pSource->GetLinkedPortal();
	const VMatrix &matThisToLinked = transforms.MatrixThisToLinked( pSource );

	matrix3x4_t cameraLocal;
	if ( !pScene->GetLocalTransform( player.m_hCameraAnchor, cameraLocal ) )
		SetIdentityMatrix( cameraLocal );

	matrix3x4_t cameraToWorld;
	if ( !pScene->GetWorldTransform( player.m_hCameraAnchor, cameraToWorld ) )
		ConcatTransforms( playerRoot, cameraLocal, cameraToWorld );

	matrix3x4_t rawRoot;
	UTIL_Portal_TransformPose( matThisToLinked, playerRoot, rawRoot );

	matrix3x4_t levelCameraLocal;
	MatrixCopy( cameraLocal, levelCameraLocal );

	bool bReleveled = AdjustPlayerCameraOnTeleport( matThisToLinked, cameraToWorld, levelCameraLocal, playerRoot, player );
	if ( bReleveled )
	{
		// Start from the tilted pose with the old anchor and roll both upright over time
		if ( player.StartRollCorrection( rawRoot, playerRoot, cameraLocal, levelCameraLocal, portal_roll_correction_time.GetFloat() ) )
			MatrixCopy( rawRoot, playerRoot );
		else
			pScene->SetLocalTransform( player.m_hCameraAnchor, levelCameraLocal );
	}

	// The countdown restarts at the teleport and runs out in RunKinematicCountdown
	player.ResetKinematicWindow( pPhysics );

	TeleportBody( pPhysics, player.m_hBody, matThisToLinked, pDestination, playerRoot );

	if ( portal_debug_teleport.GetBool() )
	{
		DevMsg( "PORTAL %s TELEPORTING: player%s, yaw %.1f pitch %.1f\n", PortalSlot_Name( pSource->GetSlot() ),
			bReleveled ? " (re-leveled)" : "", player.m_flYaw, player.m_flPitch );
	}

	return true;
}
