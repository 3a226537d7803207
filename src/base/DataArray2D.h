///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray2D.h
///	\author  Paul Ullrich
///	\version June 26, 2015
///
///	<remarks>
///		Copyright 2000-2010 Paul Ullrich
///
///		This file is distributed as part of the IsoBin source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _DATAARRAY2D_H_
#define _DATAARRAY2D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A contiguous row-major array of rank 2 that owns its data.
///	</summary>
template <typename T>
class DataArray2D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray2D() :
		m_data(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Constructor with dimension sizes.
	///	</summary>
	DataArray2D(
		size_t sSize0,
		size_t sSize1
	) :
		m_data(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		Allocate(sSize0, sSize1);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray2D(const DataArray2D<T> & da) :
		m_data(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		Assign(da);
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~DataArray2D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate data in this DataArray2D.  All entries are zeroed.
	///	</summary>
	void Allocate(
		size_t sSize0,
		size_t sSize1
	) {
		Deallocate();

		m_sSize[0] = sSize0;
		m_sSize[1] = sSize1;

		if (GetTotalSize() == 0) {
			return;
		}

		m_data = reinterpret_cast<T *>(malloc(GetTotalSize() * sizeof(T)));
		if (m_data == NULL) {
			_EXCEPTION1("Failed malloc call (%lu bytes)",
				GetTotalSize() * sizeof(T));
		}

		Zero();
	}

	///	<summary>
	///		Release the data held by this DataArray2D.
	///	</summary>
	void Deallocate() {
		if (m_data != NULL) {
			free(m_data);
		}
		m_data = NULL;
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Determine if this DataArray2D holds data.
	///	</summary>
	bool IsAttached() const {
		return (m_data != NULL);
	}

public:
	///	<summary>
	///		Get the total number of elements.
	///	</summary>
	size_t GetTotalSize() const {
		return (m_sSize[0] * m_sSize[1]);
	}

	///	<summary>
	///		Get the size of the specified dimension.
	///	</summary>
	inline size_t GetSize(int dim) const {
		return m_sSize[dim];
	}

public:
	///	<summary>
	///		Assignment.
	///	</summary>
	void Assign(const DataArray2D<T> & da) {
		if (this == &da) {
			return;
		}
		if (!da.IsAttached()) {
			Deallocate();
			return;
		}
		Allocate(da.m_sSize[0], da.m_sSize[1]);
		memcpy(m_data, da.m_data, GetTotalSize() * sizeof(T));
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray2D<T> & operator= (const DataArray2D<T> & da) {
		Assign(da);
		return (*this);
	}

public:
	///	<summary>
	///		Zero the data content of this object.
	///	</summary>
	void Zero() {
		if (!IsAttached()) {
			_EXCEPTIONT("Attempted operation on unattached DataArray2D");
		}
		memset(m_data, 0, GetTotalSize() * sizeof(T));
	}

	///	<summary>
	///		Set every element to the given value.
	///	</summary>
	void Fill(const T & x) {
		if (!IsAttached()) {
			_EXCEPTIONT("Attempted operation on unattached DataArray2D");
		}
		for (size_t i = 0; i < GetTotalSize(); i++) {
			m_data[i] = x;
		}
	}

public:
	///	<summary>
	///		Pointer to the underlying contiguous data.
	///	</summary>
	inline T * GetData() {
		return m_data;
	}

	///	<summary>
	///		Pointer to the underlying contiguous data.
	///	</summary>
	inline const T * GetData() const {
		return m_data;
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline T & operator()(size_t i, size_t j) {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i * m_sSize[1] + j];
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline const T & operator()(size_t i, size_t j) const {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i * m_sSize[1] + j];
	}

private:
	///	<summary>
	///		The size of each dimension of this DataArray2D.
	///	</summary>
	size_t m_sSize[2];

	///	<summary>
	///		A pointer to the data for this DataArray2D.
	///	</summary>
	T * m_data;

};

///////////////////////////////////////////////////////////////////////////////

#endif
