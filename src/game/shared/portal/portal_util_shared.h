//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Portal frame math shared by placement, teleportation and the portal cameras.
//
//			Portal space: +X (forward) is the surface normal, out of the wall. +Z is the
//			portal's up. The origin sits portal_mesh_depth behind the surface, so the
//			clip point (origin + forward * depth) lies on the surface itself.
//
//=============================================================================//

#ifndef PORTAL_UTIL_SHARED_H
#define PORTAL_UTIL_SHARED_H
#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/vector4d.h"
#include "mathlib/vmatrix.h"
#include "portal_shareddefs.h"

class IPortalPhysicsWorld;

// Unit length basis vectors of a (possibly scaled) transform
Vector UTIL_Portal_Forward( const matrix3x4_t &transform );
Vector UTIL_Portal_Up( const matrix3x4_t &transform );
Vector UTIL_Portal_Origin( const matrix3x4_t &transform );

// Point on the surface where the optical and physical transition happens
Vector UTIL_Portal_ClipPoint( const matrix3x4_t &portalToWorld );

// Builds the matrix that maps anything relative to the source portal to the same thing
// relative to the destination portal, as if it had passed through the shared clip plane.
void UTIL_Portal_PortalToPortal( const matrix3x4_t &sourceToWorld, const matrix3x4_t &destinationToWorld, VMatrix *pMatrix );
VMatrix UTIL_Portal_PortalToPortal( const matrix3x4_t &sourceToWorld, const matrix3x4_t &destinationToWorld );

// World space plane of the portal surface, (normal, -normal . clippoint). The normal faces out of the wall.
Vector4D UTIL_Portal_GetPortalPlane( const matrix3x4_t &portalToWorld );

// Applies a portal matrix to a full pose
void UTIL_Portal_TransformPose( const VMatrix &matThisToLinked, const matrix3x4_t &poseSource, matrix3x4_t &poseTransformed );
void UTIL_Portal_PointTransform( const VMatrix &matThisToLinked, const Vector &ptSource, Vector &ptTransformed );
void UTIL_Portal_VectorTransform( const VMatrix &matThisToLinked, const Vector &vSource, Vector &vTransformed );

PortalOrientation_t UTIL_Portal_ClassifyOrientation( const Vector &vSurfaceNormal );

// Up axis of a portal placed on a surface. Floors and ceilings use the shooter's facing, anything
// else uses world up, both projected onto the surface. Returns false if the projection degenerates.
bool UTIL_Portal_ComputeUpAxis( const Vector &vSurfaceNormal, const Vector &vViewForward, PortalOrientation_t orientation, Vector *pUp );

// Builds a portal transform from a frame. vForward and vUp must be unit length and perpendicular.
void UTIL_Portal_BuildTransform( const Vector &vOrigin, const Vector &vForward, const Vector &vUp, float flScale, matrix3x4_t &portalToWorld );

// Nudges a placement away from walls and ledges so a ~1x1 portal fits. Up/down is resolved
// first, then left/right, each with a single trace pair.
Vector UTIL_Portal_AdjustOriginToObstacles( IPortalPhysicsWorld *pPhysics, const Vector &vCandidate, const Vector &vSurfaceNormal, const Vector &vUp );

// True if the transform's up axis is within flTolerance (per component) of world up
bool UTIL_Portal_IsUpright( const matrix3x4_t &transform, float flTolerance );

#endif // PORTAL_UTIL_SHARED_H
