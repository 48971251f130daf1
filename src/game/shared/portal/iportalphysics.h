//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: The slice of the physics engine the portal code reads and writes.
//			The host implements this on top of whatever simulates its bodies.
//
//=============================================================================//

#ifndef IPORTALPHYSICS_H
#define IPORTALPHYSICS_H
#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/mathlib.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

struct PortalTrace_t
{
	PortalTrace_t() : endpos( vec3_origin ), normal( vec3_origin ), distance( 0.0f ), bHit( false ) {}

	bool DidHit() const { return bHit; }

	Vector		endpos;
	Vector		normal;
	float		distance;
	CBaseHandle	hEntity;
	bool		bHit;
};

enum PortalCollisionEventType_t
{
	PORTAL_COLLISION_EVENT_START = 0,
	PORTAL_COLLISION_EVENT_STOP,
};

struct PortalCollisionEvent_t
{
	PortalCollisionEventType_t	type;
	CBaseHandle					hBody0;
	CBaseHandle					hBody1;
};

abstract_class IPortalPhysicsWorld
{
public:
	virtual ~IPortalPhysicsWorld() {}

	// Nearest hit along vDir (unit length) within flMaxDistance against bodies in fCollisionMask.
	// bSolid false means a trace starting inside a body reports the exit point instead of distance 0.
	virtual bool TraceRay( const Vector &vStart, const Vector &vDir, float flMaxDistance, bool bSolid, unsigned int fCollisionMask, PortalTrace_t *pTrace ) = 0;

	virtual bool GetBodyTransform( CBaseHandle hBody, matrix3x4_t &transform ) = 0;
	virtual void SetBodyTransform( CBaseHandle hBody, const matrix3x4_t &transform ) = 0;

	virtual void GetBodyVelocity( CBaseHandle hBody, Vector *pVelocity, AngularImpulse *pAngularVelocity ) = 0;
	virtual void SetBodyVelocity( CBaseHandle hBody, const Vector *pVelocity, const AngularImpulse *pAngularVelocity ) = 0;

	virtual unsigned int GetBodyCollisionFilter( CBaseHandle hBody ) = 0;
	virtual void SetBodyCollisionFilter( CBaseHandle hBody, unsigned int fFilterMask ) = 0;

	// Kinematic bodies keep their velocity but ignore gravity and contacts
	virtual void SetBodyMotionMode( CBaseHandle hBody, PortalBodyMotion_t mode ) = 0;

	// Collision start/stop notifications accumulated since the last ClearCollisionEvents()
	virtual int GetCollisionEventCount() const = 0;
	virtual const PortalCollisionEvent_t &GetCollisionEvent( int i ) const = 0;
	virtual void ClearCollisionEvents() = 0;
};

#endif // IPORTALPHYSICS_H
