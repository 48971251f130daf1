//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Per frame placement of the portal cameras. Must run after the host has
//			propagated transforms for the frame and before anything renders.
//
// $NoKeywords: $
//=============================================================================//

#ifndef C_PORTAL_CAMERA_SYNC_H
#define C_PORTAL_CAMERA_SYNC_H

#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector4d.h"
#include "basehandle.h"

class CProp_Portal;
class C_PortalCamera;
class IPortalSceneHost;

// World plane to the camera's view space, normalized on its xyz part
void PortalCamera_ComputeNearPlane( const C_PortalCamera *pCamera, const Vector4D &vWorldPlane, Vector4D *pNear );

// Moves both portal cameras to the main camera's pose as seen through their portal and clips
// each against the linked portal's surface. Returns false, touching nothing, unless both portals
// are open and linked with cameras and the main camera exists.
bool PortalCamera_SyncPair( IPortalSceneHost *pScene, CBaseHandle hMainCamera, CProp_Portal *pPortalA, CProp_Portal *pPortalB );

#endif //C_PORTAL_CAMERA_SYNC_H
