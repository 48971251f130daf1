//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
// $NoKeywords: $
//=============================================================================//

#include "c_portal_camera_sync.h"
#include "c_portal_camera.h"
#include "prop_portal_shared.h"
#include "portal_util_shared.h"
#include "iportalscene.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

void PortalCamera_ComputeNearPlane( const C_PortalCamera *pCamera, const Vector4D &vWorldPlane, Vector4D *pNear )
{
	VMatrix matViewToWorld;
	pCamera->GetCameraToWorldView( &matViewToWorld );

	// planes transform by the inverse transpose of the point transform
	Vector4D vViewPlane;
	Vector4DMultiply( matViewToWorld.Transpose(), vWorldPlane, vViewPlane );

	float flLength = sqrtf( vViewPlane.x * vViewPlane.x + vViewPlane.y * vViewPlane.y + vViewPlane.z * vViewPlane.z );
	if ( flLength < PORTAL_DEGENERATE_EPSILON )
	{
		AssertMsg( false, "Degenerate portal plane" );
		*pNear = vViewPlane;
		return;
	}

	Vector4DMultiply( vViewPlane, 1.0f / flLength, *pNear );
}

static void SyncCameraThroughPortal( IPortalSceneHost *pScene, const matrix3x4_t &mainCameraToWorld, CProp_Portal *pThis, CProp_Portal *pOther )
{
	C_PortalCamera *pCamera = pThis->GetCamera();
	AssertMsg( pCamera->GetOwnerPortal() == pThis, "Portal camera outlived its portal" );

	VMatrix matThisToLinked;
	UTIL_Portal_PortalToPortal( pThis->PortalToWorld(), pOther->PortalToWorld(), &matThisToLinked );

	matrix3x4_t cameraToWorld;
	UTIL_Portal_TransformPose( matThisToLinked, mainCameraToWorld, cameraToWorld );

	pCamera->SetCameraToWorld( cameraToWorld );

	// portal cameras have no parent, local is world
	pScene->SetLocalTransform( pCamera->GetEntityHandle(), cameraToWorld );

	Vector4D vNear;
	PortalCamera_ComputeNearPlane( pCamera, pOther->GetPortalPlane(), &vNear );
	pCamera->SetNearPlane( vNear );
}

bool PortalCamera_SyncPair( IPortalSceneHost *pScene, CBaseHandle hMainCamera, CProp_Portal *pPortalA, CProp_Portal *pPortalB )
{
	if ( !pPortalA || !pPortalB )
		return false;

	if ( pPortalA->GetLinkedPortal() != pPortalB || pPortalB->GetLinkedPortal() != pPortalA )
		return false;

	if ( !pPortalA->GetCamera() || !pPortalB->GetCamera() )
		return false;

	if ( !hMainCamera.IsValid() )
		return false;

	matrix3x4_t mainCameraToWorld;
	if ( !pScene->GetWorldTransform( hMainCamera, mainCameraToWorld ) )
		return false;

	SyncCameraThroughPortal( pScene, mainCameraToWorld, pPortalA, pPortalB );
	SyncCameraThroughPortal( pScene, mainCameraToWorld, pPortalB, pPortalA );

	return true;
}
