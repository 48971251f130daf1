//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
//=============================================================================//

#include "portal_util_shared.h"
#include "iportalphysics.h"
#include "mathlib/mathlib.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

Vector UTIL_Portal_Forward( const matrix3x4_t &transform )
{
	Vector vForward;
	MatrixGetColumn( transform, 0, vForward );
	VectorNormalize( vForward );
	return vForward;
}

Vector UTIL_Portal_Up( const matrix3x4_t &transform )
{
	Vector vUp;
	MatrixGetColumn( transform, 2, vUp );
	VectorNormalize( vUp );
	return vUp;
}

Vector UTIL_Portal_Origin( const matrix3x4_t &transform )
{
	Vector vOrigin;
	MatrixGetColumn( transform, 3, vOrigin );
	return vOrigin;
}

Vector UTIL_Portal_ClipPoint( const matrix3x4_t &portalToWorld )
{
	return UTIL_Portal_Origin( portalToWorld ) + UTIL_Portal_Forward( portalToWorld ) * portal_mesh_depth.GetFloat();
}

void UTIL_Portal_PortalToPortal( const matrix3x4_t &sourceToWorld, const matrix3x4_t &destinationToWorld, VMatrix *pMatrix )
{
	const float flDepth = portal_mesh_depth.GetFloat();

	// The source origin is behind its clip plane, the destination origin behind its own. Shift so
	// that the source clip plane lands on the source origin going in, and the destination origin
	// lands on the destination clip plane coming out.
	VMatrix matSourceClipToOrigin, matDestinationOriginToClip;
	MatrixBuildTranslation( matSourceClipToOrigin, UTIL_Portal_Forward( sourceToWorld ) * -flDepth );
	MatrixBuildTranslation( matDestinationOriginToClip, UTIL_Portal_Forward( destinationToWorld ) * flDepth );

	//inverse of the source, general inverse since portals carry a scale
	VMatrix matSourceToWorldInv;
	bool bInverted = MatrixInverseGeneral( VMatrix( sourceToWorld ), matSourceToWorldInv );
	AssertMsg( bInverted, "Portal transform is singular" );
	if ( !bInverted )
	{
		pMatrix->Identity(); //don't accidentally teleport objects to zero space
		return;
	}

	//180 degree rotation about up
	VMatrix matRotation;
	matRotation.Identity();
	matRotation.m[0][0] = -1.0f;
	matRotation.m[1][1] = -1.0f;

	VMatrix matDestinationToWorld( destinationToWorld );

	*pMatrix = matDestinationOriginToClip * matDestinationToWorld * matRotation * matSourceToWorldInv * matSourceClipToOrigin;
}

VMatrix UTIL_Portal_PortalToPortal( const matrix3x4_t &sourceToWorld, const matrix3x4_t &destinationToWorld )
{
	VMatrix matResult;
	UTIL_Portal_PortalToPortal( sourceToWorld, destinationToWorld, &matResult );
	return matResult;
}

Vector4D UTIL_Portal_GetPortalPlane( const matrix3x4_t &portalToWorld )
{
	Vector vNormal = UTIL_Portal_Forward( portalToWorld );
	Vector ptClip = UTIL_Portal_ClipPoint( portalToWorld );
	return Vector4D( vNormal.x, vNormal.y, vNormal.z, -vNormal.Dot( ptClip ) );
}

void UTIL_Portal_TransformPose( const VMatrix &matThisToLinked, const matrix3x4_t &poseSource, matrix3x4_t &poseTransformed )
{
	VMatrix matResult = matThisToLinked * VMatrix( poseSource );
	MatrixCopy( matResult.As3x4(), poseTransformed );
}

void UTIL_Portal_PointTransform( const VMatrix &matThisToLinked, const Vector &ptSource, Vector &ptTransformed )
{
	ptTransformed = matThisToLinked * ptSource;
}

void UTIL_Portal_VectorTransform( const VMatrix &matThisToLinked, const Vector &vSource, Vector &vTransformed )
{
	vTransformed = matThisToLinked.ApplyRotation( vSource );
}

PortalOrientation_t UTIL_Portal_ClassifyOrientation( const Vector &vSurfaceNormal )
{
	float flLength = vSurfaceNormal.Length();
	if ( flLength < PORTAL_DEGENERATE_EPSILON )
		return PORTAL_ORIENTATION_OTHER;

	float flCos = clamp( fabs( vSurfaceNormal.z ) / flLength, 0.0f, 1.0f );
	float flDegreesFromVertical = RAD2DEG( acos( flCos ) );

	if ( flDegreesFromVertical <= portal_horizontal_tolerance.GetFloat() )
		return PORTAL_ORIENTATION_HORIZONTAL;

	return PORTAL_ORIENTATION_OTHER;
}

bool UTIL_Portal_ComputeUpAxis( const Vector &vSurfaceNormal, const Vector &vViewForward, PortalOrientation_t orientation, Vector *pUp )
{
	Vector vReference;
	if ( orientation == PORTAL_ORIENTATION_HORIZONTAL )
	{
		//level floor/ceiling, up is wherever the shooter was facing
		vReference = vViewForward;
	}
	else
	{
		vReference.Init( 0.0f, 0.0f, 1.0f );
	}

	Vector vUp = vReference - vSurfaceNormal * vReference.Dot( vSurfaceNormal );
	if ( vUp.Length() < PORTAL_DEGENERATE_EPSILON )
		return false;

	VectorNormalize( vUp );
	*pUp = vUp;
	return true;
}

void UTIL_Portal_BuildTransform( const Vector &vOrigin, const Vector &vForward, const Vector &vUp, float flScale, matrix3x4_t &portalToWorld )
{
	Vector vLeft = CrossProduct( vUp, vForward );
	portalToWorld.Init( vForward * flScale, vLeft * flScale, vUp * flScale, vOrigin );
}

Vector UTIL_Portal_AdjustOriginToObstacles( IPortalPhysicsWorld *pPhysics, const Vector &vCandidate, const Vector &vSurfaceNormal, const Vector &vUp )
{
	const float flTraceLength = portal_obstacle_trace_length.GetFloat();

	Vector vCorrected = vCandidate;
	Vector vRight = CrossProduct( vSurfaceNormal, vUp );

	PortalTrace_t tr;

	// Vertical first
	if ( pPhysics->TraceRay( vCorrected, -vUp, flTraceLength, false, MASK_PORTAL_STATIC_GEOMETRY, &tr ) )
	{
		vCorrected += vUp * ( flTraceLength - tr.distance );
	}
	else if ( pPhysics->TraceRay( vCorrected, vUp, flTraceLength, false, MASK_PORTAL_STATIC_GEOMETRY, &tr ) )
	{
		vCorrected -= vUp * ( flTraceLength - tr.distance );
	}

	// Then horizontal, from wherever the vertical pass left us
	if ( pPhysics->TraceRay( vCorrected, -vRight, flTraceLength, false, MASK_PORTAL_STATIC_GEOMETRY, &tr ) )
	{
		vCorrected += vRight * ( flTraceLength - tr.distance );
	}
	else if ( pPhysics->TraceRay( vCorrected, vRight, flTraceLength, false, MASK_PORTAL_STATIC_GEOMETRY, &tr ) )
	{
		vCorrected -= vRight * ( flTraceLength - tr.distance );
	}

	return vCorrected;
}

bool UTIL_Portal_IsUpright( const matrix3x4_t &transform, float flTolerance )
{
	Vector vUp = UTIL_Portal_Up( transform );
	return ( fabs( vUp.x ) <= flTolerance ) &&
		   ( fabs( vUp.y ) <= flTolerance ) &&
		   ( fabs( vUp.z - 1.0f ) <= flTolerance );
}
